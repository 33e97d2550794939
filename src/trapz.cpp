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

#include "trapz/core/Integrator.hpp"
#include "trapz/io/Message.hpp"
#include "trapz/io/SampleParser.hpp"
#include "trapz/misc/OptionsParser.hpp"
#include "trapz/misc/Timer.hpp"
#include "trapz/misc/VersionLogger.hpp"
#include <boost/optional.hpp>
#include <boost/program_options.hpp>
#include <iostream>

using namespace trapz;

template <typename REAL>
static int
integrate_file( const OptionsInfo& optionsInfo )
{
   Integrator<REAL> integrator{ optionsInfo.integrator };
   const Message& msg = integrator.getMessage();

   print_header( msg, "TRAPZ" );

   double readtime = 0;
   boost::optional<Samples<REAL>> samples;

   {
      Timer t( readtime );
      samples = SampleParser<REAL>::loadSamples( optionsInfo.instance_file,
                                                 !optionsInfo.has_dx );
   }

   // Check whether reading was successful or not
   if( !samples )
   {
      msg.error( "error loading samples {}\n", optionsInfo.instance_file );
      return 1;
   }

   msg.info( "read {} columns of {} samples in {:.3} seconds\n",
             samples->getNColumns(), samples->getNSamples(), readtime );

   Vec<REAL> integrals;
   if( optionsInfo.has_dx )
      integrals = integrator.integrate_columns_even(
          samples->ys, REAL( optionsInfo.dx ) );
   else
      integrals = integrator.integrate_columns( samples->ys, samples->x );

   for( std::size_t k = 0; k != integrals.size(); ++k )
      fmt::print( "column {}: {}\n", k + 1, integrals[k] );

   const Statistics& stats = integrator.getStatistics();
   msg.info( "\nintegrated {} columns in {:.3} seconds: {} uniform, {} "
             "non-uniform, {} fixed spacing, {} invalid\n",
             stats.nintegrals, stats.integrationtime, stats.nuniform,
             stats.nnonuniform, stats.neven, stats.ninvalid );

   return 0;
}

int
main( int argc, char* argv[] )
{
   // get the options passed by the user
   OptionsInfo optionsInfo;
   try
   {
      optionsInfo = parseOptions( argc, argv );
   }
   catch( const boost::program_options::error& ex )
   {
      std::cerr << "Error while parsing the options.\n" << '\n';
      std::cerr << ex.what() << '\n';
      return 1;
   }

   if( !optionsInfo.is_complete )
      return 0;

   switch( optionsInfo.precision )
   {
   case Precision::kSingle:
      return integrate_file<float>( optionsInfo );
   case Precision::kDouble:
      return integrate_file<double>( optionsInfo );
   }

   return 1;
}
