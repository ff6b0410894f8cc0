#ifndef CORE_ACTION_SINK_HPP
#define CORE_ACTION_SINK_HPP

#include "core/models.hpp"

#include <string>

struct DispatchResult {
    bool success = false;
    std::string error;
};

// Receives committed actions. Implementations must return without waiting
// for the action to finish.
class ActionSink {
public:
    virtual ~ActionSink() = default;
    virtual DispatchResult dispatch(const SlotConfig& slot) = 0;
};

#endif
