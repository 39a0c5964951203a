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
#include <gavel/chain/custody_account_object.hpp>

namespace gavel { namespace chain {

   class database;
   class auction_evaluator_base;

   /**
    *  @brief capability that lets the auction protocol act as a derived authority
    *
    *  The constructor is private to auction_evaluator_base; the auction evaluators and any
    *  other class deriving from it mint proofs through its protected interface.  The proof carries the seeds of the derived
    *  identity and the custody service re-derives the identity when the proof is presented,
    *  so a proof minted for one auction does not open custody held for another.
    */
   class authority_proof
   {
      public:
         const string&   label()const { return _label; }
         const identity& scope()const { return _scope; }
         uint8_t         bump()const  { return _bump; }

      private:
         friend class auction_evaluator_base;
         authority_proof( const string& label, const identity& scope, uint8_t bump )
         :_label(label),_scope(scope),_bump(bump){}

         string   _label;
         identity _scope;
         uint8_t  _bump = 0;
   };

   /**
    *  Who is asking for a custody change: either a keyed identity that signed the current
    *  transaction or the auction protocol presenting an authority_proof.
    */
   class custody_authorizer
   {
      public:
         custody_authorizer( const identity& signer ):_signer(signer){}
         custody_authorizer( const authority_proof& proof ):_proof(proof){}

         bool                   is_proof()const { return _proof.valid(); }
         const identity&        signer()const   { return _signer; }
         const authority_proof& proof()const    { return *_proof; }

      private:
         identity                 _signer;
         optional<authority_proof> _proof;
   };

   /**
    *  @brief moves quantities between custody accounts and changes who controls them
    *
    *  Every call either fully applies or throws; a thrown call leaves no trace once the
    *  enclosing undo session unwinds.
    */
   class custody_service
   {
      public:
         virtual ~custody_service(){}

         virtual const custody_account_object* find( const identity& account )const = 0;
         /** @throws custody_account_not_found */
         virtual const custody_account_object& get( const identity& account )const = 0;

         virtual void transfer( const identity& from, const identity& to,
                                const custody_authorizer& authorizer, uint64_t amount ) = 0;
         virtual void set_authority( const identity& account, const identity& new_authority,
                                     const custody_authorizer& authorizer ) = 0;
         /**
          *  Remove an empty custody account and pay its deposit to the native balance of
          *  @p destination.
          *  @return the deposit paid out
          */
         virtual uint64_t close( const identity& account, const identity& destination,
                                 const custody_authorizer& authorizer ) = 0;
   };

   /**
    *  The custody service backed by the custody_account_index of a database.
    */
   class ledger_custody_service : public custody_service
   {
      public:
         explicit ledger_custody_service( database& db ):_db(db){}

         const custody_account_object* find( const identity& account )const override;
         const custody_account_object& get( const identity& account )const override;

         void     transfer( const identity& from, const identity& to,
                            const custody_authorizer& authorizer, uint64_t amount ) override;
         void     set_authority( const identity& account, const identity& new_authority,
                                 const custody_authorizer& authorizer ) override;
         uint64_t close( const identity& account, const identity& destination,
                         const custody_authorizer& authorizer ) override;

      protected:
         void verify_authorizer( const custody_account_object& account, const custody_authorizer& authorizer )const;

         database& _db;
   };

} } // gavel::chain
