#include <pgtemp/process/command.h>
#include <pgtemp/temp_db/readiness_prober.h>

#include <spdlog/spdlog.h>

#include <thread>

namespace pgtemp {

Result<int> ReadinessProber::waitReady(const ClientChannel& channel,
                                       const std::string& psql) const {
    const auto probe =
        channel.command({psql, "-d", "postgres", "-h", channel.socketPath, "-c", "\\dt"});

    for (int attempt = 1; attempt <= retry_; ++attempt) {
        std::this_thread::sleep_for(interval_);

        auto rc = process::runCommand(probe, showOutput_);
        if (rc && rc.value() == 0) {
            spdlog::debug("ReadinessProber: server ready after {} attempt(s)", attempt);
            return attempt;
        }
        spdlog::debug("ReadinessProber: attempt {}/{} failed ({})", attempt, retry_,
                      rc ? std::to_string(rc.value()) : rc.error().message);
    }
    return Error{ErrorCode::Timeout, "Couldn't start PG server"};
}

} // namespace pgtemp
