#include "queue_error.hh"

char const* rc::to_string(queue_error e)
{
    switch (e)
    {
    case queue_error::invalid_argument: return "invalid_argument";
    case queue_error::null_source: return "null_source";
    case queue_error::null_destination: return "null_destination";
    case queue_error::empty_queue: return "empty_queue";
    case queue_error::index_out_of_range: return "index_out_of_range";
    case queue_error::insufficient_capacity: return "insufficient_capacity";
    case queue_error::concurrent_modification: return "concurrent_modification";
    }

    return "unknown queue_error";
}
