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

#ifndef _TRAPZ_MISC_NUM_HPP_
#define _TRAPZ_MISC_NUM_HPP_

#include <cmath>
#include <limits>
#include <type_traits>

namespace trapz
{

template <typename REAL>
struct num_traits
{
   constexpr static bool is_floating_point =
       std::is_floating_point<REAL>::value;
};

/// relative tolerance for comparing the interval widths of an abscissa
template <typename REAL>
struct spacing_tolerance;

template <>
struct spacing_tolerance<float>
{
   static constexpr float
   value()
   {
      return 1e-6f;
   }
};

template <>
struct spacing_tolerance<double>
{
   static constexpr double
   value()
   {
      return 1e-12;
   }
};

template <typename REAL>
class Num
{
 public:
   Num() : spacingtol( spacing_tolerance<REAL>::value() ) {}

   static REAL
   nan()
   {
      return std::numeric_limits<REAL>::quiet_NaN();
   }

   static bool
   isNan( const REAL& x )
   {
      return x != x;
   }

   /// absolute tolerance for interval widths compared against the first
   /// width h0; the relative tolerance is scaled by max(|h0|, 1), a NaN width
   /// falls back to the unscaled tolerance
   REAL
   scaledSpacingTol( const REAL& h0 ) const
   {
      using std::abs;
      using std::fmax;

      return fmax( abs( h0 ), REAL{ 1 } ) * spacingtol;
   }

   /// returns true if the interval width h differs from h0 by more than tol
   static bool
   spacingDiffers( const REAL& h, const REAL& h0, const REAL& tol )
   {
      using std::abs;

      return abs( h - h0 ) > tol;
   }

   REAL
   getSpacingTol() const
   {
      return spacingtol;
   }

   void
   setSpacingTol( const REAL& value )
   {
      this->spacingtol = value;
   }

 private:
   REAL spacingtol;
};

} // namespace trapz

#endif
