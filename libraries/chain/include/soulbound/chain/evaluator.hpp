/*
 * Copyright (c) 2023 Michel Santos and contributors.
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

#include <soulbound/chain/exceptions.hpp>
#include <soulbound/protocol/operations.hpp>

namespace soulbound {
   namespace chain {

      class database;

      class generic_evaluator {
      public:
         virtual ~generic_evaluator() {}

         virtual int get_type() const = 0;

         /**
          * @brief Check the operation against the current state and, when @p apply is set, apply it
          *
          * The caller owns the undo session; an evaluator never commits or reverts on its own.
          */
         virtual operation_result start_evaluate(database &d, const operation &op, bool apply);

         virtual operation_result evaluate(const operation &op) = 0;

         virtual operation_result apply(const operation &op) = 0;

         database &db() const;

      protected:
         database *_db = nullptr;
      };

      class op_evaluator {
      public:
         virtual ~op_evaluator() {}

         virtual operation_result evaluate(database &d, const operation &op, bool apply) = 0;
      };

      template<typename T>
      class op_evaluator_impl : public op_evaluator {
      public:
         operation_result evaluate(database &d, const operation &o, bool apply = true) override {
            T eval;
            return eval.start_evaluate(d, o, apply);
         }
      };

      template<typename DerivedEvaluator>
      class evaluator : public generic_evaluator {
      public:
         int get_type() const override {
            return operation::tag<typename DerivedEvaluator::operation_type>::value;
         }

         operation_result evaluate(const operation &o) final override {
            auto *eval = static_cast<DerivedEvaluator *>(this);
            const auto &op = o.get<typename DerivedEvaluator::operation_type>();
            return eval->do_evaluate(op);
         }

         operation_result apply(const operation &o) final override {
            auto *eval = static_cast<DerivedEvaluator *>(this);
            const auto &op = o.get<typename DerivedEvaluator::operation_type>();
            return eval->do_apply(op);
         }
      };

   }
} // soulbound::chain
