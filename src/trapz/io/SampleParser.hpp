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

#ifndef _TRAPZ_IO_SAMPLE_PARSER_HPP_
#define _TRAPZ_IO_SAMPLE_PARSER_HPP_

#include "trapz/Config.hpp"
#include "trapz/misc/Vec.hpp"
#include "trapz/misc/fmt.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <boost/optional.hpp>
#include <boost/spirit/include/qi.hpp>
#include <cstdio>
#include <fstream>
#include <istream>
#include <iterator>
#include <string>
#include <utility>

#ifdef TRAPZ_USE_BOOST_IOSTREAMS_WITH_BZIP2
#include <boost/iostreams/filter/bzip2.hpp>
#endif
#ifdef TRAPZ_USE_BOOST_IOSTREAMS_WITH_ZLIB
#include <boost/iostreams/filter/gzip.hpp>
#endif

namespace trapz
{

/// sampled functions sharing one abscissa
template <typename REAL>
struct Samples
{
   std::string name;
   // empty if the samples were read without an abscissa column
   Vec<REAL> x;
   Vec<Vec<REAL>> ys;

   int
   getNSamples() const
   {
      return ys.empty() ? static_cast<int>( x.size() )
                        : static_cast<int>( ys[0].size() );
   }

   int
   getNColumns() const
   {
      return static_cast<int>( ys.size() );
   }
};

/// Parser for column data files. Every line holds one sample, the values
/// are separated by whitespace and/or commas. Blank lines and lines starting
/// with '#' or '%' are ignored. With an abscissa the first column is x and
/// every further column holds the function values of one sampled function.
template <typename REAL>
class SampleParser
{
 public:
   static boost::optional<Samples<REAL>>
   loadSamples( const std::string& filename, bool has_abscissa = true )
   {
      SampleParser<REAL> parser( has_abscissa );

      if( !parser.parseFile( filename ) )
         return boost::none;

      Samples<REAL> samples;
      samples.name = filename;

      auto first_value_column = parser.columns.begin();
      if( has_abscissa )
      {
         samples.x = std::move( parser.columns[0] );
         ++first_value_column;
      }

      samples.ys.assign( std::make_move_iterator( first_value_column ),
                         std::make_move_iterator( parser.columns.end() ) );

      return samples;
   }

 private:
   explicit SampleParser( bool _has_abscissa ) : has_abscissa( _has_abscissa )
   {
   }

   bool
   parseFile( const std::string& filename );

   bool
   parse( std::istream& file, const std::string& filename );

   static bool
   parseLine( const std::string& strline, Vec<double>& values );

   static bool
   isSkippedLine( const std::string& strline )
   {
      std::size_t pos = strline.find_first_not_of( " \t\r" );
      return pos == std::string::npos || strline[pos] == '#' ||
             strline[pos] == '%';
   }

   bool has_abscissa;
   Vec<Vec<REAL>> columns;
};

template <typename REAL>
bool
SampleParser<REAL>::parseFile( const std::string& filename )
{
   std::ifstream file( filename, std::ifstream::in );
   boost::iostreams::filtering_istream in;

   if( !file )
   {
      fmt::print( stderr, "could not open sample file {}\n", filename );
      return false;
   }

#ifdef TRAPZ_USE_BOOST_IOSTREAMS_WITH_ZLIB
   if( boost::algorithm::ends_with( filename, ".gz" ) )
      in.push( boost::iostreams::gzip_decompressor() );
#endif

#ifdef TRAPZ_USE_BOOST_IOSTREAMS_WITH_BZIP2
   if( boost::algorithm::ends_with( filename, ".bz2" ) )
      in.push( boost::iostreams::bzip2_decompressor() );
#endif

   in.push( file );

   return parse( in, filename );
}

template <typename REAL>
bool
SampleParser<REAL>::parseLine( const std::string& strline,
                               Vec<double>& values )
{
   namespace qi = boost::spirit::qi;

   values.clear();

   std::string::const_iterator it = strline.begin();
   const std::string::const_iterator end = strline.end();

   bool success = qi::phrase_parse( it, end, qi::double_ % -qi::lit( ',' ),
                                    qi::ascii::space, values );

   return success && it == end;
}

template <typename REAL>
bool
SampleParser<REAL>::parse( std::istream& file, const std::string& filename )
{
   const std::size_t mincolumns = has_abscissa ? 2 : 1;

   std::string strline;
   Vec<double> values;
   int nline = 0;

   columns.clear();

   while( getline( file, strline ) )
   {
      ++nline;

      if( isSkippedLine( strline ) )
         continue;

      if( !parseLine( strline, values ) )
      {
         fmt::print( stderr, "{}:{}: could not parse line '{}'\n", filename,
                     nline, strline );
         return false;
      }

      if( columns.empty() )
      {
         if( values.size() < mincolumns )
         {
            fmt::print( stderr,
                        "{}:{}: expected at least {} columns but found {}\n",
                        filename, nline, mincolumns, values.size() );
            return false;
         }
         columns.resize( values.size() );
      }
      else if( values.size() != columns.size() )
      {
         fmt::print( stderr, "{}:{}: expected {} columns but found {}\n",
                     filename, nline, columns.size(), values.size() );
         return false;
      }

      for( std::size_t c = 0; c != values.size(); ++c )
         columns[c].push_back( REAL( values[c] ) );
   }

   if( columns.empty() )
   {
      fmt::print( stderr, "{}: no samples found\n", filename );
      return false;
   }

   return true;
}

} // namespace trapz

#endif
