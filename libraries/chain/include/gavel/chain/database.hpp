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

#include <gavel/chain/account_object.hpp>
#include <gavel/chain/auction_record.hpp>
#include <gavel/chain/chain_parameters.hpp>
#include <gavel/chain/custody_account_object.hpp>
#include <gavel/chain/custody_service.hpp>
#include <gavel/chain/evaluator.hpp>
#include <gavel/chain/genesis_state.hpp>
#include <gavel/chain/time_source.hpp>

#include <gavel/protocol/transaction.hpp>

#include <gavel/db/object_database.hpp>

#include <fc/log/logger.hpp>

namespace gavel { namespace chain {
   class transaction_evaluation_state;

   /**
    *   @class database
    *   @brief the auction ledger: accounts, custody accounts and the transitions that move them
    *
    *   All state lives in object_database indexes.  Transactions are applied one at a time; the
    *   database is not thread safe and the host is expected to serialize access.
    */
   class database : public db::object_database
   {
         //////////////////// db_management.cpp ////////////////////
      public:
         database();
         ~database() override;

         /**
          * @brief Load the initial accounts, custody balances and parameters
          *
          * Genesis objects are created outside of any undo session and cannot be rolled back.
          */
         void init_genesis( const genesis_state_type& genesis_state );

         const chain_parameters& get_chain_parameters()const { return _parameters; }
         const chain_id_type&    get_chain_id()const { return _parameters.chain_id; }

         time_point_sec     now()const;
         const time_source& get_time_source()const { return *_time_source; }
         void               set_time_source( shared_ptr<time_source> source );

         custody_service&       custody() { return *_custody; }
         const custody_service& custody()const { return *_custody; }
         /// replaces the custody service, the database keeps ownership
         void                   set_custody_service( unique_ptr<custody_service> service );

         //////////////////// db_transaction.cpp ////////////////////
      public:
         /**
          * Verify the signatures, then apply every operation in order.  When any operation throws,
          * the changes of the whole transaction are undone and the exception propagates.
          */
         processed_transaction push_transaction( const signed_transaction& trx );

         operation_result apply_operation( transaction_evaluation_state& eval_state, const operation& op );

         /// true while a transaction signed by @p who is being applied
         bool is_signer( const identity& who )const;

         template<typename EvaluatorType>
         void register_evaluator()
         {
            const auto op_type = operation::tag<typename EvaluatorType::operation_type>::value;
            FC_ASSERT( op_type >= 0, "Negative operation type" );
            FC_ASSERT( op_type < (int)_operation_evaluators.size(),
                       "The operation type (${a}) must be smaller than the size of _operation_evaluators (${b})",
                       ("a", op_type)("b", _operation_evaluators.size()) );
            _operation_evaluators[op_type] = std::make_unique<op_evaluator_impl<EvaluatorType>>();
         }

      private:
         processed_transaction _apply_transaction( const signed_transaction& trx );

         //////////////////// db_ledger.cpp ////////////////////
      public:
         const account_object*         find_account( const identity& key )const;
         const account_object&         get_account( const identity& key )const;
         const custody_account_object* find_custody_account( const identity& key )const;

         /// @return the native balance, zero for an unknown account
         uint64_t get_balance( const identity& key )const;
         /// credits the native balance, creating a plain account on first credit
         void     add_balance( const identity& key, uint64_t amount );
         /** @throws insufficient_balance */
         void     reduce_balance( const identity& key, uint64_t amount );
         /**
          * Move the whole balance of an account to @p destination and remove the account.
          * @return the amount moved
          */
         uint64_t reclaim_account( const identity& key, const identity& destination );

         /// true when the balance covers the rent exemption for the account's data
         bool     is_persistently_funded( const account_object& account )const;

         //////////////////// db_getter.cpp ////////////////////
      public:
         auction_status           get_auction_status( const identity& record )const;
         optional<auction_record> find_auction( const identity& record )const;

         //////////////////// db_init.cpp ////////////////////
      private:
         void initialize_evaluators();
         void initialize_indexes();

         vector< unique_ptr<op_evaluator> >     _operation_evaluators;

         chain_parameters                       _parameters;
         shared_ptr<time_source>                _time_source;
         unique_ptr<custody_service>            _custody;
         const transaction_evaluation_state*    _current_trx_state = nullptr;
   };

} }
