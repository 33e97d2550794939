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

#include "trapz/core/Trapezoid.hpp"

namespace trapz
{

double
trapezoid_f64( const Vec<double>& y, const Vec<double>& x )
{
   return trapezoid( y, x );
}

float
trapezoid_f32( const Vec<float>& y, const Vec<float>& x )
{
   return trapezoid( y, x );
}

float
trapezoid_even_f32( const Vec<float>& y, float dx )
{
   return trapezoid_even( y, dx );
}

double
trapezoid_even_f64( const Vec<double>& y, double dx )
{
   return trapezoid_even( y, dx );
}

} // namespace trapz
