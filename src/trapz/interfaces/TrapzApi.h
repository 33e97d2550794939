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

#ifndef _TRAPZ_INTERFACES_TRAPZ_API_H_
#define _TRAPZ_INTERFACES_TRAPZ_API_H_

#ifdef __cplusplus
extern "C" {
#endif

/* Trapezoidal integration of the samples (x[i], y[i]). Uniformly spaced
 * abscissas are detected and integrated with the composite rule.
 * Returns NaN if ny < 2, nx != ny or one of the arrays is NULL.
 */
double
trapz_trapezoid_f64( const double* y, int ny, const double* x, int nx );

/* single precision variant, float in and float out rather than double */
float
trapz_trapezoid_f32( const float* y, int ny, const float* x, int nx );

/* Trapezoidal integration of ny samples with the fixed spacing dx.
 * Returns NaN if ny < 2, dx <= 0 or y is NULL.
 */
float
trapz_trapezoid_even_f32( const float* y, int ny, float dx );

double
trapz_trapezoid_even_f64( const double* y, int ny, double dx );

#ifdef __cplusplus
}
#endif

#endif
