#pragma once

#include <pgtemp/core/types.h>
#include <pgtemp/temp_db/server_launcher.h>

#include <string>

namespace pgtemp {

/**
 * @brief Polls a starting server until it accepts a client connection
 *
 * The server gives no readiness signal, so the only test is to connect. Each
 * attempt runs `psql -d postgres -h <socket> -c \dt` after sleeping `interval`
 * (the first attempt included). The first zero exit wins; after `retry`
 * failed attempts the server is declared never ready.
 */
class ReadinessProber {
public:
    ReadinessProber(int retry, Duration interval, bool showOutput)
        : retry_(retry), interval_(interval), showOutput_(showOutput) {}

    /**
     * @return Number of attempts made (1-based) on success
     */
    Result<int> waitReady(const ClientChannel& channel, const std::string& psql) const;

    [[nodiscard]] int retry() const noexcept { return retry_; }
    [[nodiscard]] Duration interval() const noexcept { return interval_; }

private:
    int retry_;
    Duration interval_;
    bool showOutput_;
};

} // namespace pgtemp
