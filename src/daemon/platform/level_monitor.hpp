#pragma once

class LevelMonitor {
public:
    virtual ~LevelMonitor() = default;
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool is_running() const = 0;
    // Latest normalized input level in [0,1].
    virtual float level() const = 0;
};
