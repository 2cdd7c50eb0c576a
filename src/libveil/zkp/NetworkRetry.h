#pragma once

#include <libveil/zkp/MixerConfig.h>
#include <libveil/zkp/MixerError.h>

#include <xrpl/basics/Log.h>
#include <xrpl/beast/utility/Journal.h>

#include <chrono>
#include <thread>

namespace veil {
namespace zkp {

/**
 * Call f, retrying NetworkError with exponential backoff.
 *
 * Any other error propagates at once. The last NetworkError propagates
 * when the attempts run out.
 */
template <class F>
auto
withNetworkRetry(
    MixerConfig const& config,
    beast::Journal j,
    char const* what,
    F&& f) -> decltype(f())
{
    auto delay = config.networkBackoff;
    for (int attempt = 1;; ++attempt)
    {
        try
        {
            return f();
        }
        catch (MixerError const& e)
        {
            if (e.kind() != ErrorKind::NetworkError ||
                attempt >= config.networkRetries)
                throw;
            JLOG(j.warn()) << what << " failed (attempt " << attempt << "/"
                           << config.networkRetries << "): " << e.what();
        }
        if (delay.count() > 0)
            std::this_thread::sleep_for(delay);
        delay *= 2;
    }
}

} // namespace zkp
} // namespace veil
