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

#ifndef _TRAPZ_CORE_INTEGRATOR_OPTIONS_HPP_
#define _TRAPZ_CORE_INTEGRATOR_OPTIONS_HPP_

namespace trapz
{

struct IntegratorOptions
{
   // relative tolerance for the uniform spacing test, values <= 0 select the
   // default of the floating point type
   double spacingtol = 0.0;

   // number of threads used for integrating several columns, 0 lets tbb
   // decide and 1 disables parallel processing
   int threads = 0;

   // with fewer columns than this integrate_columns() stays sequential
   int mincolumnsparallel = 4;

   int verbosity = 3;
};

} // namespace trapz

#endif
