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

#include "catch2/catch.hpp"
#include "trapz/core/Integrator.hpp"
#include "trapz/core/Trapezoid.hpp"
#include <cmath>
#include <string>
#include <utility>
#include <vector>

using namespace trapz;

using CapturedOutput = std::vector<std::pair<int, std::string>>;

static void
capture_integrator_output( int level, const char* data, size_t len,
                           void* usrdata )
{
   auto captured = static_cast<CapturedOutput*>( usrdata );
   captured->emplace_back( level, std::string( data, len ) );
}

TEST_CASE( "integrator-matches-free-functions", "[core]" )
{
   Integrator<double> integrator{};
   integrator.getMessage().setVerbosityLevel( VerbosityLevel::kQuiet );

   Vec<double> y{ 5, 6, 1, 4, 6, 2 };
   Vec<double> x{ 1, 2, 4, 6, 7, 9 };
   Vec<double> xu{ 0.0, 0.5, 1.0, 1.5, 2.0, 2.5 };

   REQUIRE( integrator.integrate( y, x ) == 30.5 );
   REQUIRE( integrator.integrate( y, xu ) == trapezoid_f64( y, xu ) );
   REQUIRE( integrator.integrate_even( y, 0.003 ) ==
            trapezoid_even_f64( y, 0.003 ) );

   const Statistics& stats = integrator.getStatistics();
   REQUIRE( stats.nintegrals == 3 );
   REQUIRE( stats.nnonuniform == 1 );
   REQUIRE( stats.nuniform == 1 );
   REQUIRE( stats.neven == 1 );
   REQUIRE( stats.ninvalid == 0 );
   REQUIRE( stats.integrationtime >= 0.0 );
}

TEST_CASE( "integrator-reports-invalid-input", "[core]" )
{
   CapturedOutput captured;
   Integrator<double> integrator{};
   integrator.getMessage().setOutputCallback( capture_integrator_output,
                                              &captured );

   REQUIRE( std::isnan(
       integrator.integrate( Vec<double>{ 1.0, 2.0 }, Vec<double>{ 0.0 } ) ) );
   REQUIRE( std::isnan(
       integrator.integrate( Vec<double>{ 1.0 }, Vec<double>{ 0.0 } ) ) );
   REQUIRE( std::isnan(
       integrator.integrate_even( Vec<double>{ 1.0, 2.0 }, -1.0 ) ) );

   REQUIRE( integrator.getStatistics().nintegrals == 3 );
   REQUIRE( integrator.getStatistics().ninvalid == 3 );
   REQUIRE( captured.size() == 3 );
   for( const auto& line : captured )
      REQUIRE( line.first == static_cast<int>( VerbosityLevel::kWarning ) );
   REQUIRE( captured[0].second.find( "2 values over 1 abscissas" ) !=
            std::string::npos );
}

TEST_CASE( "integrator-logs-spacing-when-detailed", "[core]" )
{
   CapturedOutput captured;
   IntegratorOptions options{};
   options.verbosity = static_cast<int>( VerbosityLevel::kDetailed );

   Integrator<double> integrator{ options };
   integrator.getMessage().setOutputCallback( capture_integrator_output,
                                              &captured );

   integrator.integrate( Vec<double>{ 1, 2, 3 }, Vec<double>{ 0, 1, 2 } );
   integrator.integrate( Vec<double>{ 1, 2, 3 }, Vec<double>{ 0, 1, 3 } );

   REQUIRE( captured.size() == 2 );
   REQUIRE( captured[0].second == "integrating 3 samples on a uniform abscissa\n" );
   REQUIRE( captured[1].second ==
            "integrating 3 samples on a non-uniform abscissa\n" );
}

TEST_CASE( "integrator-spacing-tolerance-option", "[core]" )
{
   Vec<double> y{ 2.0, 7.0, 1.0, 8.0, 2.0 };
   Vec<double> x{ 0.0, 1.0, 2.0, 3.0 + 1e-9, 4.0 };

   Integrator<double> strict{};
   strict.getMessage().setVerbosityLevel( VerbosityLevel::kQuiet );
   REQUIRE( strict.integrate( y, x ) ==
            trapezoid_general( y.data(), x.data(), 5 ) );
   REQUIRE( strict.getStatistics().nnonuniform == 1 );

   IntegratorOptions options{};
   options.spacingtol = 1e-6;
   options.verbosity = 0;
   Integrator<double> relaxed{ options };
   REQUIRE( relaxed.getNum().getSpacingTol() == 1e-6 );
   REQUIRE( relaxed.integrate( y, x ) == trapezoid_uniform( y.data(), 5, 1.0 ) );
   REQUIRE( relaxed.getStatistics().nuniform == 1 );
}

TEST_CASE( "integrator-columns-match-single-integrals", "[core]" )
{
   IntegratorOptions options{};
   options.verbosity = 0;
   Integrator<double> integrator{ options };

   Vec<double> x{ 0.0, 0.1, 0.3, 0.35, 0.9, 1.0 };
   Vec<Vec<double>> ys{ { 1, 2, 3, 4, 5, 6 },
                        { 0.5, -1, 2.25, 3, 0, 1 },
                        { 1, 2, 3 },
                        { 3, 3, 3, 3, 3, 3 } };

   Vec<double> integrals = integrator.integrate_columns( ys, x );

   REQUIRE( integrals.size() == 4 );
   REQUIRE( integrals[0] == trapezoid_f64( ys[0], x ) );
   REQUIRE( integrals[1] == trapezoid_f64( ys[1], x ) );
   REQUIRE( std::isnan( integrals[2] ) );
   REQUIRE( integrals[3] == trapezoid_f64( ys[3], x ) );

   const Statistics& stats = integrator.getStatistics();
   REQUIRE( stats.nintegrals == 4 );
   REQUIRE( stats.nnonuniform == 3 );
   REQUIRE( stats.ninvalid == 1 );
}

TEST_CASE( "integrator-columns-parallel", "[core]" )
{
   Vec<double> x;
   for( int i = 0; i <= 100; ++i )
      x.push_back( 0.01 * i * i );

   Vec<Vec<double>> ys;
   for( int k = 0; k < 32; ++k )
   {
      Vec<double> y;
      for( double t : x )
         y.push_back( std::sin( t + k ) );
      ys.push_back( std::move( y ) );
   }

   IntegratorOptions sequential_options{};
   sequential_options.threads = 1;
   sequential_options.verbosity = 0;
   Integrator<double> sequential{ sequential_options };

   IntegratorOptions parallel_options{};
   parallel_options.threads = 4;
   parallel_options.mincolumnsparallel = 1;
   parallel_options.verbosity = 0;
   Integrator<double> parallel{ parallel_options };

   Vec<double> expected = sequential.integrate_columns( ys, x );
   Vec<double> result = parallel.integrate_columns( ys, x );

   REQUIRE( expected.size() == ys.size() );
   REQUIRE( result == expected );
   REQUIRE( parallel.getStatistics().nnonuniform == 32 );
   REQUIRE( parallel.getStatistics().ninvalid == 0 );

   Vec<double> expected_even = sequential.integrate_columns_even( ys, 0.25 );
   Vec<double> result_even = parallel.integrate_columns_even( ys, 0.25 );
   REQUIRE( result_even == expected_even );
   REQUIRE( result_even[7] == trapezoid_even_f64( ys[7], 0.25 ) );
}

TEST_CASE( "integrator-columns-invalid-input", "[core]" )
{
   IntegratorOptions options{};
   options.verbosity = 0;
   Integrator<float> integrator{ options };

   Vec<Vec<float>> ys{ { 1.0f, 2.0f }, { 1.0f } };

   Vec<float> short_abscissa = integrator.integrate_columns( ys, Vec<float>{ 0.0f } );
   REQUIRE( short_abscissa.size() == 2 );
   REQUIRE( std::isnan( short_abscissa[0] ) );
   REQUIRE( std::isnan( short_abscissa[1] ) );

   Vec<float> bad_spacing = integrator.integrate_columns_even( ys, 0.0f );
   REQUIRE( std::isnan( bad_spacing[0] ) );
   REQUIRE( std::isnan( bad_spacing[1] ) );

   Vec<float> even = integrator.integrate_columns_even( ys, 0.5f );
   REQUIRE( even[0] == 0.75f );
   REQUIRE( std::isnan( even[1] ) );

   const Statistics& stats = integrator.getStatistics();
   REQUIRE( stats.nintegrals == 6 );
   REQUIRE( stats.ninvalid == 5 );
   REQUIRE( stats.neven == 1 );
}
