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

#ifndef _TRAPZ_MISC_OPTIONS_PARSER_HPP_
#define _TRAPZ_MISC_OPTIONS_PARSER_HPP_

#include "trapz/core/IntegratorOptions.hpp"
#include "trapz/misc/fmt.hpp"
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace trapz
{

namespace po = boost::program_options;

enum class Precision : int
{
   kSingle = 0,
   kDouble = 1,
};

struct OptionsInfo
{
   std::string instance_file;
   Precision precision = Precision::kDouble;
   // spacing given on the command line, the file has no abscissa column then
   double dx = 0.0;
   bool has_dx = false;
   IntegratorOptions integrator;
   bool is_complete = false;

   bool
   existsFile( const std::string& filename ) const
   {
      std::ifstream infile( filename );
      return infile.good();
   }

   void
   parse( const std::vector<std::string>& opts )
   {
      std::string precision_name = "double";

      po::options_description desc( "Usage: trapz [options] <file>\n\n"
                                    "integrates every column of a sample "
                                    "file with the trapezoidal rule\n\n"
                                    "Options" );

      // clang-format off
      desc.add_options()
         ( "help,h", "produce help message" )
         ( "file,f", po::value( &instance_file )->required(),
           "sample file, first column is the abscissa" )
         ( "dx", po::value( &dx ),
           "fixed spacing, every column of the file holds function values" )
         ( "precision,p", po::value( &precision_name )->default_value( "double" ),
           "floating point precision: single or double" )
         ( "threads,t", po::value( &integrator.threads )->default_value( 0 ),
           "maximal number of threads for integrating columns, 0 for automatic" )
         ( "verbosity,v", po::value( &integrator.verbosity )->default_value( 3 ),
           "verbosity: 0 - quiet, 1 - errors, 2 - warnings, 3 - normal, 4 - detailed" )
         ( "spacing-tolerance", po::value( &integrator.spacingtol ),
           "relative tolerance of the uniform spacing test, "
           "default 1e-6 for single and 1e-12 for double precision" );
      // clang-format on

      po::positional_options_description pos;
      pos.add( "file", 1 );

      po::variables_map vm;
      po::store( po::command_line_parser( opts )
                     .options( desc )
                     .positional( pos )
                     .run(),
                 vm );

      if( vm.count( "help" ) || opts.empty() )
      {
         std::cout << desc << std::endl;
         return;
      }

      po::notify( vm );

      if( precision_name == "single" )
         precision = Precision::kSingle;
      else if( precision_name == "double" )
         precision = Precision::kDouble;
      else
         throw po::invalid_option_value( precision_name );

      if( integrator.verbosity < 0 || integrator.verbosity > 4 )
         throw po::invalid_option_value(
             fmt::format( "verbosity {}", integrator.verbosity ) );

      if( integrator.threads < 0 )
         throw po::invalid_option_value(
             fmt::format( "threads {}", integrator.threads ) );

      has_dx = vm.count( "dx" ) != 0;

      if( !existsFile( instance_file ) )
         throw po::error(
             fmt::format( "file {} does not exist", instance_file ) );

      is_complete = true;
   }
};

inline OptionsInfo
parseOptions( int argc, char* argv[] )
{
   OptionsInfo optionsInfo;
   std::vector<std::string> opts( argv + 1, argv + argc );
   optionsInfo.parse( opts );
   return optionsInfo;
}

} // namespace trapz

#endif
