#pragma once

#include "rockswap/core/Cascade.hpp"
#include "rockswap/core/Trace.hpp"

namespace rockswap::platform {

// Forwards engine trace events to SDL logging under the application category.
class SdlTraceLogger {
public:
    explicit SdlTraceLogger(bool verbose = false) : verbose_(verbose) {}

    void Log(const core::TraceEvent& event) const;
    void LogPass(const core::Board& board, const core::PassReport& report) const;

    core::TraceSink sink() const;
    core::PassListener passListener() const;

private:
    bool verbose_ = false;
};

}  // namespace rockswap::platform
