#pragma once
#include <string>

// Best-effort, payload-free notification that staged data is waiting.
struct IWakeSignal
{
    virtual ~IWakeSignal() = default;
    // Returns false when the consumer could not be reached. Never throws.
    virtual bool wake(const std::string& uri) = 0;
};

// Posts the wake URI to the consumer's loopback listener (POST /open).
// Implemented in src/wake_signal.cpp
class HttpWakeSignal : public IWakeSignal
{
  public:
    HttpWakeSignal(std::string host, int port, int timeout_ms = 1000);

    bool wake(const std::string& uri) override;

  private:
    std::string host_;
    int         port_;
    int         timeout_ms_;
};

// Used when no consumer endpoint is configured; the consumer finds the data by polling.
class NullWakeSignal : public IWakeSignal
{
  public:
    bool wake(const std::string& /*uri*/) override
    {
        return false;
    }
};
