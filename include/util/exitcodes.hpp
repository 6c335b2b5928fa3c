#pragma once

namespace exitc
{
// process exit codes shared by phonelinkd and phonelinkctl
inline constexpr int ok        = 0;
inline constexpr int failure   = 1;
inline constexpr int bad_args  = 2;
inline constexpr int no_server = 3;
}  // namespace exitc
