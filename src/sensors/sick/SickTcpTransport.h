#pragma once
#include "sensors/ITransport.h"
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>

// CoLa-A stream over TCP: every telegram is framed as STX ... ETX.
class SickTcpTransport final : public ITransport {
public:
    static constexpr char STX = '\x02';
    static constexpr char ETX = '\x03';

    SickTcpTransport();
    ~SickTcpTransport() override;

    TransportError connect(const SensorConfig& cfg) override;
    TransportError readFrame(RawFrame& out) override;
    void cancel() override;
    void close() override;
    ConnectionState state() const override { return state_.load(); }
    std::string lastError() const override;

private:
    using clock_mono = std::chrono::steady_clock;

    TransportError fail(TransportError e, const std::string& why);
    TransportError sendTelegram(const std::string& body);
    // Pops one complete frame from rx_ if present.
    bool extractFrame(RawFrame& out);
    void closeSocket();

    SensorConfig cfg_{};
    int fd_{-1};
    std::string rx_;
    bool in_frame_{false};

    std::atomic<bool> cancelled_{false};
    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};

    mutable std::mutex err_mu_;
    std::string last_error_;
};
