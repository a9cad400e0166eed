#pragma once

// Tracy instrumentation. Without TRACY_ENABLE every macro compiles to nothing.
//   POLARBEAR_PROFILE_FRAME(name)         frame boundary of the named loop
//   POLARBEAR_PROFILE_FUNCTION()          zone for the enclosing function
//   POLARBEAR_PROFILE_SCOPE(name)         named zone
//   POLARBEAR_PROFILE_COUNT(name, value)  plots a queue depth or job count

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#ifdef TRACY_ENABLE

#include <cstdint>

#include <tracy/Tracy.hpp>

#define POLARBEAR_PROFILE_FRAME(name) FrameMarkNamed(name)
#define POLARBEAR_PROFILE_FUNCTION() ZoneScoped
#define POLARBEAR_PROFILE_SCOPE(name) ZoneScopedN(name)
#define POLARBEAR_PROFILE_COUNT(name, value) TracyPlot(name, static_cast<int64_t>(value))

#else // !TRACY_ENABLE

#define POLARBEAR_PROFILE_FRAME(name) (void)0
#define POLARBEAR_PROFILE_FUNCTION() (void)0
#define POLARBEAR_PROFILE_SCOPE(name) (void)0
#define POLARBEAR_PROFILE_COUNT(name, value) (void)0

#endif // TRACY_ENABLE

// NOLINTEND(cppcoreguidelines-macro-usage)
