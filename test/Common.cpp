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

#define CATCH_CONFIG_MAIN
#include "catch2/catch.hpp"
#include "trapz/misc/Num.hpp"
#include "trapz/misc/Vec.hpp"
#include <cstddef>
#include <cmath>
#include <limits>

using namespace trapz;

TEST_CASE( "num-default-spacing-tolerance", "[misc]" )
{
   Num<double> num_double{};
   Num<float> num_float{};

   REQUIRE( num_double.getSpacingTol() == 1e-12 );
   REQUIRE( num_float.getSpacingTol() == 1e-6f );

   num_double.setSpacingTol( 1e-8 );
   REQUIRE( num_double.getSpacingTol() == 1e-8 );
}

TEST_CASE( "num-scaled-spacing-tolerance", "[misc]" )
{
   Num<double> num{};

   // widths below one use the unscaled tolerance
   REQUIRE( num.scaledSpacingTol( 0.5 ) == 1e-12 );
   REQUIRE( num.scaledSpacingTol( 0.0 ) == 1e-12 );
   REQUIRE( num.scaledSpacingTol( 1e3 ) == 1e3 * 1e-12 );
   REQUIRE( num.scaledSpacingTol( -1e3 ) == 1e3 * 1e-12 );
   REQUIRE( num.scaledSpacingTol( std::numeric_limits<double>::quiet_NaN() ) ==
            1e-12 );
}

TEST_CASE( "num-spacing-differs", "[misc]" )
{
   const double tol = 1e-12;

   REQUIRE_FALSE( Num<double>::spacingDiffers( 1.0, 1.0, tol ) );
   REQUIRE_FALSE( Num<double>::spacingDiffers( 1.0 + 1e-14, 1.0, tol ) );
   REQUIRE( Num<double>::spacingDiffers( 1.0 + 1e-9, 1.0, tol ) );
   REQUIRE( Num<double>::spacingDiffers( 1.0 - 1e-9, 1.0, tol ) );
   // comparisons with NaN never report a difference
   REQUIRE_FALSE( Num<double>::spacingDiffers(
       std::numeric_limits<double>::quiet_NaN(), 1.0, tol ) );
}

TEST_CASE( "num-nan", "[misc]" )
{
   REQUIRE( std::isnan( Num<double>::nan() ) );
   REQUIRE( std::isnan( Num<float>::nan() ) );
   REQUIRE( Num<double>::isNan( Num<double>::nan() ) );
   REQUIRE_FALSE( Num<double>::isNan( 0.0 ) );
}

// reports a size without holding any elements
struct SizeOnly
{
   std::size_t n;

   std::size_t
   size() const
   {
      return n;
   }
};

TEST_CASE( "int-size-rejects-sizes-beyond-int", "[misc]" )
{
   const std::size_t intmax =
       static_cast<std::size_t>( std::numeric_limits<int>::max() );

   REQUIRE( int_size( Vec<double>{ 1.0, 2.0, 3.0 } ) == 3 );
   REQUIRE( int_size( Vec<double>{} ) == 0 );
   REQUIRE( int_size( SizeOnly{ intmax } ) == std::numeric_limits<int>::max() );
   REQUIRE( int_size( SizeOnly{ intmax + 1 } ) == -1 );
   // 2^32 + 3 would wrap around to 3 when narrowed
   if( sizeof( std::size_t ) > sizeof( unsigned int ) )
   {
      const std::size_t wrapping =
          static_cast<std::size_t>( std::numeric_limits<unsigned int>::max() ) +
          4;
      REQUIRE( int_size( SizeOnly{ wrapping } ) == -1 );
   }
   REQUIRE( int_size( SizeOnly{ std::numeric_limits<std::size_t>::max() } ) ==
            -1 );
}
