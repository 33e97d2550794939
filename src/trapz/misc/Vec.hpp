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

#ifndef _TRAPZ_MISC_VEC_HPP_
#define _TRAPZ_MISC_VEC_HPP_

#include <cstddef>
#include <limits>
#include <vector>

namespace trapz
{

template <typename T>
using Vec = std::vector<T>;

/// size of the container as an int index, or -1 if it holds more elements
/// than an int can address
template <typename CONTAINER>
int
int_size( const CONTAINER& v )
{
   const std::size_t size = v.size();
   if( size > static_cast<std::size_t>( std::numeric_limits<int>::max() ) )
      return -1;

   return static_cast<int>( size );
}

} // namespace trapz

#endif
