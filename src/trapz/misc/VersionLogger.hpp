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

#ifndef _TRAPZ_MISC_VERSION_LOGGER_HPP_
#define _TRAPZ_MISC_VERSION_LOGGER_HPP_

#include "trapz/Config.hpp"
#include "trapz/io/Message.hpp"
#include "trapz/misc/MulAdd.hpp"
#include "trapz/misc/fmt.hpp"
#include <boost/version.hpp>

#ifdef TRAPZ_TBB
#include "tbb/version.h"
#endif

namespace trapz
{

inline void
print_header( const Message& msg, const char* name )
{
   msg.info( "{} version {}.{}.{} [GitHash: {}]\n", name, TRAPZ_VERSION_MAJOR,
             TRAPZ_VERSION_MINOR, TRAPZ_VERSION_PATCH, TRAPZ_GITHASH );
   msg.info( "External libraries: \n" );
   msg.info( "  Boost    {}.{}.{} \t (https://www.boost.org/)\n",
             BOOST_VERSION / 100000, BOOST_VERSION / 100 % 1000,
             BOOST_VERSION % 100 );
   msg.info( "  fmt      {}.{}.{} \t (https://github.com/fmtlib/fmt)\n",
             FMT_VERSION / 10000, FMT_VERSION / 100 % 100,
             FMT_VERSION % 100 );
#ifdef TRAPZ_TBB
   msg.info( "  oneTBB   {}.{} \t (https://github.com/oneapi-src/oneTBB)\n",
             TBB_VERSION_MAJOR, TBB_VERSION_MINOR );
#endif
   msg.info( "fused multiply-add: {}\n\n",
             has_fast_fma<double>() ? "hardware" : "emulated" );
}

} // namespace trapz

#endif
