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
#include <gavel/protocol/operations.hpp>

namespace gavel { namespace protocol {

   /**
    * @defgroup transactions Transactions
    *
    * All transactions are sets of operations that must be applied atomically.  Signatures cover
    * the chain id followed by the packed transaction, so a transaction signed for one deployment
    * cannot be replayed against another.
    *
    * @{
    */

   /**
    *  @brief groups operations that should be applied atomically
    */
   struct transaction
   {
      vector<operation>  operations;

      digest_type digest()const;
      /// the digest that signatures commit to
      digest_type sig_digest( const chain_id_type& chain_id )const;
      void validate()const;

      /// visit all operations
      template<typename Visitor>
      void visit( Visitor&& visitor )const
      {
         for( auto& op : operations )
            op.visit( std::forward<Visitor>( visitor ) );
      }
   };

   /**
    *  @brief adds a signature to a transaction
    */
   struct signed_transaction : public transaction
   {
      signed_transaction( const transaction& trx = transaction() )
         : transaction(trx){}

      /** signs and appends to signatures */
      const signature_type& sign( const private_key_type& key, const chain_id_type& chain_id );

      /** returns signature but does not append */
      signature_type sign( const private_key_type& key, const chain_id_type& chain_id )const;

      /**
       *  Recovers the identities that signed this transaction.  Fails if two signatures come
       *  from the same key.
       */
      flat_set<identity> get_signature_keys( const chain_id_type& chain_id )const;

      vector<signature_type> signatures;

      /// Removes all operations and signatures
      void clear() { operations.clear(); signatures.clear(); }
   };

   /**
    *  @brief captures the result of evaluating the operations contained in the transaction
    */
   struct processed_transaction : public signed_transaction
   {
      processed_transaction( const signed_transaction& trx = signed_transaction() )
         : signed_transaction(trx){}

      vector<operation_result> operation_results;
   };

   /// @} transactions group

} } // gavel::protocol

FC_REFLECT( gavel::protocol::transaction, (operations) )
FC_REFLECT_DERIVED( gavel::protocol::signed_transaction, (gavel::protocol::transaction), (signatures) )
FC_REFLECT_DERIVED( gavel::protocol::processed_transaction, (gavel::protocol::signed_transaction), (operation_results) )
