#pragma once

#include <functional>

namespace SessionScope::dsp
{

/** Polled by long-running computations at coarse stage boundaries.
    Returns true once the owning task has been asked to stop.
    An empty function never cancels.
*/
using ShouldCancel = std::function<bool()>;

inline bool isCancelled (const ShouldCancel& shouldCancel)
{
    return shouldCancel != nullptr && shouldCancel();
}

} // namespace SessionScope::dsp
