/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#pragma once
#include <gavel/chain/types.hpp>

#include <fc/time.hpp>

namespace gavel { namespace chain {

   /**
    *  Supplies the ledger's notion of "now" to auction transitions.
    */
   class time_source
   {
      public:
         virtual ~time_source(){}
         virtual time_point_sec now()const = 0;
   };

   /** reads the wall clock */
   class system_time_source : public time_source
   {
      public:
         time_point_sec now()const override { return time_point_sec( fc::time_point::now() ); }
   };

   /** a clock that only moves when told to */
   class manual_time_source : public time_source
   {
      public:
         explicit manual_time_source( time_point_sec start = time_point_sec() ):_now(start){}

         time_point_sec now()const override { return _now; }

         void set( time_point_sec t ) { _now = t; }
         void advance( uint32_t seconds ) { _now += seconds; }

      private:
         time_point_sec _now;
   };

} } // gavel::chain
