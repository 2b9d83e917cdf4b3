#pragma once

namespace RM
{

/// \defgroup ConstantsGroup Constants
/// \ingroup MathGroup
/// \{

/// right angle
inline constexpr static double PI2 = 1.570796326794896619231;

/// \}

} // namespace RM
