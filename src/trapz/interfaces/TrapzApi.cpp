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

#include "trapz/interfaces/TrapzApi.h"
#include "trapz/core/Trapezoid.hpp"

using namespace trapz;

double
trapz_trapezoid_f64( const double* y, int ny, const double* x, int nx )
{
   if( y == nullptr || x == nullptr )
      return Num<double>::nan();
   return trapezoid( y, ny, x, nx );
}

float
trapz_trapezoid_f32( const float* y, int ny, const float* x, int nx )
{
   if( y == nullptr || x == nullptr )
      return Num<float>::nan();
   return trapezoid( y, ny, x, nx );
}

float
trapz_trapezoid_even_f32( const float* y, int ny, float dx )
{
   if( y == nullptr )
      return Num<float>::nan();
   return trapezoid_even( y, ny, dx );
}

double
trapz_trapezoid_even_f64( const double* y, int ny, double dx )
{
   if( y == nullptr )
      return Num<double>::nan();
   return trapezoid_even( y, ny, dx );
}
