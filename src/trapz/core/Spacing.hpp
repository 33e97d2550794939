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

#ifndef _TRAPZ_CORE_SPACING_HPP_
#define _TRAPZ_CORE_SPACING_HPP_

#include "trapz/misc/Num.hpp"
#include "trapz/misc/Vec.hpp"

namespace trapz
{

enum class SpacingType : int
{
   kUniform = 0,
   kNonUniform = 1,
};

/// Classifies the abscissa x[0..n-1]. All interval widths are compared with
/// the first one, h0 = x[1] - x[0], using the tolerance
/// num.scaledSpacingTol( h0 ). The scan stops at the first width outside the
/// tolerance. Sequences with less than two points have no interval to
/// compare and are reported as uniform. The same holds for a Vec too large
/// for an int index; the integration routines reject it beforehand.
template <typename REAL>
SpacingType
detect_spacing( const REAL* x, int n, const Num<REAL>& num )
{
   if( n < 2 )
      return SpacingType::kUniform;

   const REAL h0 = x[1] - x[0];
   const REAL tol = num.scaledSpacingTol( h0 );

   for( int i = 1; i < n - 1; ++i )
   {
      if( Num<REAL>::spacingDiffers( x[i + 1] - x[i], h0, tol ) )
         return SpacingType::kNonUniform;
   }

   return SpacingType::kUniform;
}

template <typename REAL>
SpacingType
detect_spacing( const Vec<REAL>& x, const Num<REAL>& num )
{
   return detect_spacing( x.data(), int_size( x ), num );
}

template <typename REAL>
SpacingType
detect_spacing( const Vec<REAL>& x )
{
   return detect_spacing( x, Num<REAL>{} );
}

inline const char*
to_string( SpacingType type )
{
   switch( type )
   {
   case SpacingType::kUniform:
      return "uniform";
   case SpacingType::kNonUniform:
      return "non-uniform";
   }
   return "unknown";
}

} // namespace trapz

#endif
