/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * */
/*                                                                           */
/*               This file is part of the program and library                */
/*           TRAPZ --- Trapezoidal Integration of Sampled Functions          */
/*                                                                           */
/* Copyright (C) 2020-2026 Zuse Institute Berlin (ZIB)                       */
/*                                                                           */
/* Licensed under the Apache License, Version 2.0 (the "License");           */
/* you may not use this file except in compliance with the License.          */
/* You may obtain a copy of the License at                                   */
/*                                                                           */
/*     http://www.apache.org/licenses/LICENSE-2.0                            */
/*                                                                           */
/* Unless required by applicable law or agreed to in writing, software       */
/* distributed under the License is distributed on an "AS IS" BASIS,         */
/* WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.  */
/* See the License for the specific language governing permissions and       */
/* limitations under the License.                                            */
/*                                                                           */
/* You should have received a copy of the Apache-2.0 license                 */
/* along with TRAPZ; see the file LICENSE. If not visit scipopt.org.         */
/*                                                                           */
/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * */

#ifndef _TRAPZ_MISC_MUL_ADD_HPP_
#define _TRAPZ_MISC_MUL_ADD_HPP_

#include "trapz/misc/Num.hpp"
#include <cmath>

namespace trapz
{

/// computes a * b + c. For the builtin floating point types the product is
/// not rounded before the addition: std::fma uses the hardware instruction
/// if the target has one and a correctly rounded emulation otherwise. Other
/// number types get the plain expression and round twice.
template <typename REAL, bool isfp = num_traits<REAL>::is_floating_point>
struct MulAdd;

template <typename REAL>
struct MulAdd<REAL, true>
{
   static REAL
   apply( const REAL& a, const REAL& b, const REAL& c )
   {
      return std::fma( a, b, c );
   }
};

template <typename REAL>
struct MulAdd<REAL, false>
{
   static REAL
   apply( const REAL& a, const REAL& b, const REAL& c )
   {
      return a * b + c;
   }
};

template <typename REAL>
inline REAL
mul_add( const REAL& a, const REAL& b, const REAL& c )
{
   return MulAdd<REAL>::apply( a, b, c );
}

/// true if std::fma is known to be at least as fast as a * b + c for the
/// given type, i.e. the compiler maps it to a hardware instruction
template <typename REAL>
inline bool
has_fast_fma()
{
   return false;
}

template <>
inline bool
has_fast_fma<float>()
{
#ifdef FP_FAST_FMAF
   return true;
#else
   return false;
#endif
}

template <>
inline bool
has_fast_fma<double>()
{
#ifdef FP_FAST_FMA
   return true;
#else
   return false;
#endif
}

} // namespace trapz

#endif
