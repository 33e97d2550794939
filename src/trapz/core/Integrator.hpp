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

#ifndef _TRAPZ_CORE_INTEGRATOR_HPP_
#define _TRAPZ_CORE_INTEGRATOR_HPP_

#include "trapz/Config.hpp"
#include "trapz/core/IntegratorOptions.hpp"
#include "trapz/core/Spacing.hpp"
#include "trapz/core/Statistics.hpp"
#include "trapz/core/Trapezoid.hpp"
#include "trapz/io/Message.hpp"
#include "trapz/misc/Num.hpp"
#include "trapz/misc/Timer.hpp"
#include "trapz/misc/Vec.hpp"

#ifdef TRAPZ_TBB
#include "trapz/misc/tbb.hpp"
#endif

namespace trapz
{

/// Integrates sampled functions with the trapezoidal rule and keeps track of
/// what it did. The results are identical to the free functions trapezoid()
/// and trapezoid_even() when the default spacing tolerance is used; invalid
/// input still yields NaN but is reported through the message handler.
template <typename REAL>
class Integrator
{
 public:
   Integrator() = default;

   explicit Integrator( const IntegratorOptions& _options )
   {
      setOptions( _options );
   }

   void
   setOptions( const IntegratorOptions& _options )
   {
      options = _options;
      num = Num<REAL>{};
      if( options.spacingtol > 0 )
         num.setSpacingTol( REAL( options.spacingtol ) );
      msg.setVerbosityLevel(
          static_cast<VerbosityLevel>( options.verbosity ) );
   }

   REAL
   integrate( const Vec<REAL>& y, const Vec<REAL>& x );

   REAL
   integrate_even( const Vec<REAL>& y, const REAL& dx );

   /// integrates every column of ys over the shared abscissa x, a column
   /// whose length differs from x gives NaN
   Vec<REAL>
   integrate_columns( const Vec<Vec<REAL>>& ys, const Vec<REAL>& x );

   Vec<REAL>
   integrate_columns_even( const Vec<Vec<REAL>>& ys, const REAL& dx );

   const Statistics&
   getStatistics() const
   {
      return stats;
   }

   const IntegratorOptions&
   getOptions() const
   {
      return options;
   }

   const Num<REAL>&
   getNum() const
   {
      return num;
   }

   Message&
   getMessage()
   {
      return msg;
   }

 private:
   REAL
   integrate_samples( const REAL* y, const REAL* x, int n,
                      SpacingType spacing ) const
   {
      if( spacing == SpacingType::kUniform )
         return trapezoid_uniform( y, n, REAL( x[1] - x[0] ) );
      return trapezoid_general( y, x, n );
   }

   template <typename COLUMNFUNC>
   void
   for_each_column( int ncols, COLUMNFUNC&& integrate_column ) const;

   void
   count_spacing( SpacingType spacing, int nintegrals )
   {
      if( spacing == SpacingType::kUniform )
         stats.nuniform += nintegrals;
      else
         stats.nnonuniform += nintegrals;
   }

   IntegratorOptions options;
   Message msg;
   Num<REAL> num;
   Statistics stats;
};

template <typename REAL>
REAL
Integrator<REAL>::integrate( const Vec<REAL>& y, const Vec<REAL>& x )
{
   Timer timer( stats.integrationtime );
   ++stats.nintegrals;

   const int n = int_size( y );
   if( n < 2 || x.size() != y.size() )
   {
      ++stats.ninvalid;
      msg.warn( "cannot integrate {} values over {} abscissas: at least two "
                "samples of equal length are required\n",
                y.size(), x.size() );
      return Num<REAL>::nan();
   }

   const SpacingType spacing = detect_spacing( x, num );
   count_spacing( spacing, 1 );
   msg.detailed( "integrating {} samples on a {} abscissa\n", n,
                 to_string( spacing ) );

   return integrate_samples( y.data(), x.data(), n, spacing );
}

template <typename REAL>
REAL
Integrator<REAL>::integrate_even( const Vec<REAL>& y, const REAL& dx )
{
   Timer timer( stats.integrationtime );
   ++stats.nintegrals;

   const int n = int_size( y );
   if( n < 2 || dx <= 0 )
   {
      ++stats.ninvalid;
      msg.warn( "cannot integrate {} values with spacing {}: at least two "
                "samples and a positive spacing are required\n",
                y.size(), dx );
      return Num<REAL>::nan();
   }

   ++stats.neven;
   msg.detailed( "integrating {} samples with spacing {}\n", n, dx );

   return trapezoid_uniform( y.data(), n, dx );
}

template <typename REAL>
template <typename COLUMNFUNC>
void
Integrator<REAL>::for_each_column( int ncols,
                                   COLUMNFUNC&& integrate_column ) const
{
#ifdef TRAPZ_TBB
   if( options.threads != 1 && ncols >= options.mincolumnsparallel )
   {
      const int nthreads =
          options.threads == 0
              ? static_cast<int>( tbb::task_arena::automatic )
              : options.threads;
      tbb::task_arena arena( nthreads );

      arena.execute(
          [&]()
          {
             tbb::parallel_for( tbb::blocked_range<int>( 0, ncols ),
                                [&]( const tbb::blocked_range<int>& r )
                                {
                                   for( int k = r.begin(); k != r.end(); ++k )
                                      integrate_column( k );
                                } );
          } );
      return;
   }
#endif
   for( int k = 0; k < ncols; ++k )
      integrate_column( k );
}

template <typename REAL>
Vec<REAL>
Integrator<REAL>::integrate_columns( const Vec<Vec<REAL>>& ys,
                                     const Vec<REAL>& x )
{
   Timer timer( stats.integrationtime );

   const int ncols = static_cast<int>( ys.size() );
   const int n = int_size( x );
   Vec<REAL> result( ys.size(), Num<REAL>::nan() );

   stats.nintegrals += ncols;

   if( n < 2 )
   {
      stats.ninvalid += ncols;
      msg.warn( "cannot integrate {} columns over {} abscissas: at least two "
                "samples are required\n",
                ncols, x.size() );
      return result;
   }

   const SpacingType spacing = detect_spacing( x, num );
   msg.detailed( "integrating {} columns of {} samples on a {} abscissa\n",
                 ncols, n, to_string( spacing ) );

   for_each_column( ncols,
                    [&]( int k )
                    {
                       const Vec<REAL>& y = ys[k];
                       if( y.size() == x.size() )
                          result[k] =
                              integrate_samples( y.data(), x.data(), n, spacing );
                    } );

   for( int k = 0; k < ncols; ++k )
   {
      if( ys[k].size() != x.size() )
      {
         ++stats.ninvalid;
         msg.warn( "column {} has {} values but the abscissa has {}\n", k,
                   ys[k].size(), n );
      }
      else
         count_spacing( spacing, 1 );
   }

   return result;
}

template <typename REAL>
Vec<REAL>
Integrator<REAL>::integrate_columns_even( const Vec<Vec<REAL>>& ys,
                                          const REAL& dx )
{
   Timer timer( stats.integrationtime );

   const int ncols = static_cast<int>( ys.size() );
   Vec<REAL> result( ys.size(), Num<REAL>::nan() );

   stats.nintegrals += ncols;

   if( dx <= 0 )
   {
      stats.ninvalid += ncols;
      msg.warn( "cannot integrate {} columns with spacing {}: the spacing "
                "must be positive\n",
                ncols, dx );
      return result;
   }

   msg.detailed( "integrating {} columns with spacing {}\n", ncols, dx );

   for_each_column( ncols,
                    [&]( int k )
                    {
                       const Vec<REAL>& y = ys[k];
                       const int n = int_size( y );
                       if( n >= 2 )
                          result[k] = trapezoid_uniform( y.data(), n, dx );
                    } );

   for( int k = 0; k < ncols; ++k )
   {
      if( int_size( ys[k] ) < 2 )
      {
         ++stats.ninvalid;
         msg.warn( "column {} has {} values, at least two are required\n", k,
                   ys[k].size() );
      }
      else
         ++stats.neven;
   }

   return result;
}

} // namespace trapz

#endif
