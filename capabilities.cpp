#include <chrono>
#include <climits>
#include <fmt/format.h>
#include <openssl/err.h>
#include <openssl/rand.h>

#include "capabilities.h"
#include "errors.h"
#include "logger.h"

std::vector<uint8_t> MkToken::OpenSSLRandomBytes::Get(std::size_t n) {
    std::vector<uint8_t> buffer(n);
    if (n == 0) return buffer;
    if (n > static_cast<std::size_t>(INT_MAX)) {
        throw RandomSourceError(fmt::format("Cannot request {} random bytes at once", n));
    }

    if (RAND_bytes(buffer.data(), static_cast<int>(n)) != 1) {
        char reason[256];
        ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
        Logger::logMessage(spdlog::level::err, fmt::format("RAND_bytes failed: {}", reason));
        throw RandomSourceError("Error when generating random bytes");
    }
    return buffer;
}

int64_t MkToken::SystemClock::NowSeconds() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}
