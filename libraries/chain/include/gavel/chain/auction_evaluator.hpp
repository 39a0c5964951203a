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
#include <gavel/chain/evaluator.hpp>
#include <gavel/chain/account_object.hpp>
#include <gavel/chain/auction_record.hpp>
#include <gavel/chain/custody_service.hpp>

#include <gavel/protocol/derived_authority.hpp>

namespace gavel { namespace chain {

   /**
    *  Record slot access and derived authority handling shared by the four auction evaluators.
    *  authority_proof befriends this class alone, so proofs are minted here and reach custody
    *  only through the classes built on it.
    */
   class auction_evaluator_base
   {
      protected:
         auction_evaluator_base() = default;

         /**
          *  Fetch the record slot and decode it.
          *  @throws record_size_mismatch when the slot is missing or does not hold a record
          *  @throws record_owner_mismatch when the slot is not owned by the auction protocol
          */
         void load_record( const database& d, const identity& record );

         /// the derived authority that holds custody for the auction kept in @p record
         static derived_authority auction_authority( const database& d, const identity& record );
         static authority_proof   make_authority_proof( const database& d, const derived_authority& authority,
                                                       const identity& record );

         void     store_record( database& d, const auction_record& rec );
         /// remove the record slot, paying its balance to @p beneficiary
         uint64_t destroy_record( database& d, const identity& beneficiary );

         const account_object* _slot = nullptr;
         auction_record        _record;
   };

   class auction_create_evaluator : public evaluator<auction_create_evaluator>, protected auction_evaluator_base
   {
      public:
         typedef auction_create_operation operation_type;

         void_result do_evaluate( const auction_create_operation& o );
         identity    do_apply( const auction_create_operation& o );

      private:
         time_point_sec _end_at;
   };

   class auction_bid_evaluator : public evaluator<auction_bid_evaluator>, protected auction_evaluator_base
   {
      public:
         typedef auction_bid_operation operation_type;

         void_result do_evaluate( const auction_bid_operation& o );
         void_result do_apply( const auction_bid_operation& o );
   };

   class auction_cancel_evaluator : public evaluator<auction_cancel_evaluator>, protected auction_evaluator_base
   {
      public:
         typedef auction_cancel_operation operation_type;

         void_result do_evaluate( const auction_cancel_operation& o );
         void_result do_apply( const auction_cancel_operation& o );
   };

   class auction_close_evaluator : public evaluator<auction_close_evaluator>, protected auction_evaluator_base
   {
      public:
         typedef auction_close_operation operation_type;

         void_result        do_evaluate( const auction_close_operation& o );
         auction_settlement do_apply( const auction_close_operation& o );
   };

} } // gavel::chain
