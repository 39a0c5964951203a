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
#include <gavel/chain/database.hpp>
#include <gavel/chain/transaction_evaluation_state.hpp>

#include <gavel/protocol/exceptions.hpp>

namespace gavel { namespace chain {

namespace detail {

   /** clears the database's pointer to the evaluation state however the transaction ends */
   struct current_trx_guard
   {
      current_trx_guard( const transaction_evaluation_state*& slot, const transaction_evaluation_state* state )
      :_slot(slot)
      {
         _slot = state;
      }
      ~current_trx_guard() { _slot = nullptr; }

      const transaction_evaluation_state*& _slot;
   };

}

processed_transaction database::push_transaction( const signed_transaction& trx )
{ try {
   // The session is discarded by its destructor if _apply_transaction throws.
   // If we make it to merge(), the changes are kept.
   auto session = _undo_db.start_undo_session();
   auto processed_trx = _apply_transaction( trx );
   session.merge();
   return processed_trx;
} FC_CAPTURE_AND_RETHROW( (trx) ) }

processed_transaction database::_apply_transaction( const signed_transaction& trx )
{ try {
   trx.validate();

   transaction_evaluation_state eval_state(this);
   eval_state._trx = &trx;
   eval_state.signers = trx.get_signature_keys( get_chain_id() );

   detail::current_trx_guard guard( _current_trx_state, &eval_state );

   eval_state.operation_results.reserve( trx.operations.size() );

   processed_transaction ptrx(trx);
   for( const auto& op : ptrx.operations )
      eval_state.operation_results.emplace_back( apply_operation( eval_state, op ) );

   ptrx.operation_results = std::move( eval_state.operation_results );
   return ptrx;
} FC_CAPTURE_AND_RETHROW( (trx) ) }

operation_result database::apply_operation( transaction_evaluation_state& eval_state, const operation& op )
{ try {
   int i_which = op.which();
   FC_ASSERT( i_which >= 0, "Negative operation tag" );
   uint64_t u_which = uint64_t( i_which );
   FC_ASSERT( u_which < _operation_evaluators.size(), "No registered evaluator for this operation" );
   unique_ptr<op_evaluator>& eval = _operation_evaluators[ u_which ];
   FC_ASSERT( eval, "No registered evaluator for this operation" );
   return eval->evaluate( eval_state, op, true );
} FC_CAPTURE_AND_RETHROW( (op) ) }

bool database::is_signer( const identity& who )const
{
   return _current_trx_state != nullptr && _current_trx_state->signed_by( who );
}

} }
