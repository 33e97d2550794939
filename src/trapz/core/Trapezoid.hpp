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

#ifndef _TRAPZ_CORE_TRAPEZOID_HPP_
#define _TRAPZ_CORE_TRAPEZOID_HPP_

#include "trapz/core/Spacing.hpp"
#include "trapz/misc/MulAdd.hpp"
#include "trapz/misc/Num.hpp"
#include "trapz/misc/Vec.hpp"
#include <cassert>

namespace trapz
{

/// composite trapezoidal rule for n >= 2 samples with the constant spacing h:
/// h * ( y[0] / 2 + y[1] + ... + y[n-2] + y[n-1] / 2 )
template <typename REAL>
REAL
trapezoid_uniform( const REAL* y, int n, const REAL& h )
{
   assert( n >= 2 );

   REAL interior_sum{ 0 };
   for( int i = 1; i < n - 1; ++i )
      interior_sum += y[i];

   return h * mul_add( y[0] + y[n - 1], REAL{ 0.5 }, interior_sum );
}

/// sums the area of every trapezoid [x[i], x[i+1]] separately, valid for any
/// spacing of the n >= 2 abscissas
template <typename REAL>
REAL
trapezoid_general( const REAL* y, const REAL* x, int n )
{
   assert( n >= 2 );

   REAL integral{ 0 };
   for( int i = 0; i < n - 1; ++i )
   {
      const REAL dx = x[i + 1] - x[i];
      integral = mul_add( dx * REAL{ 0.5 }, y[i] + y[i + 1], integral );
   }

   return integral;
}

/// Integral of the samples (x[i], y[i]) with the trapezoidal rule. If the
/// abscissa is uniform within the tolerance of num the composite rule with
/// the first interval width is used, otherwise every segment is summed.
/// Returns NaN if there are less than two samples or the lengths differ.
template <typename REAL>
REAL
trapezoid( const REAL* y, int ny, const REAL* x, int nx, const Num<REAL>& num )
{
   if( ny < 2 || nx != ny )
      return Num<REAL>::nan();

   if( detect_spacing( x, nx, num ) == SpacingType::kUniform )
      return trapezoid_uniform( y, ny, REAL( x[1] - x[0] ) );

   return trapezoid_general( y, x, ny );
}

template <typename REAL>
REAL
trapezoid( const REAL* y, int ny, const REAL* x, int nx )
{
   return trapezoid( y, ny, x, nx, Num<REAL>{} );
}

template <typename REAL>
REAL
trapezoid( const Vec<REAL>& y, const Vec<REAL>& x, const Num<REAL>& num )
{
   if( y.size() != x.size() )
      return Num<REAL>::nan();

   return trapezoid( y.data(), int_size( y ), x.data(), int_size( x ), num );
}

template <typename REAL>
REAL
trapezoid( const Vec<REAL>& y, const Vec<REAL>& x )
{
   return trapezoid( y, x, Num<REAL>{} );
}

/// Integral of n samples with the fixed spacing dx. The spacing is not
/// checked against anything, only dx <= 0 and n < 2 yield NaN.
template <typename REAL>
REAL
trapezoid_even( const REAL* y, int n, const REAL& dx )
{
   if( n < 2 || dx <= 0 )
      return Num<REAL>::nan();

   return trapezoid_uniform( y, n, dx );
}

template <typename REAL>
REAL
trapezoid_even( const Vec<REAL>& y, const REAL& dx )
{
   return trapezoid_even( y.data(), int_size( y ), dx );
}

double
trapezoid_f64( const Vec<double>& y, const Vec<double>& x );

/// 32-bit throughout: float samples, float result, float spacing tolerance
/// (not double in and double out)
float
trapezoid_f32( const Vec<float>& y, const Vec<float>& x );

float
trapezoid_even_f32( const Vec<float>& y, float dx );

double
trapezoid_even_f64( const Vec<double>& y, double dx );

} // namespace trapz

#endif
