/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/hasher/hasher_impl.hpp"

#include <memory>

#include <openssl/evp.h>
#include <boost/assert.hpp>

namespace tessera::crypto {

  namespace {
    using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

    common::Hash256 digest256(const EVP_MD *md, common::BufferView data) {
      common::Hash256 out;
      EvpMdCtxPtr ctx{EVP_MD_CTX_new(), &EVP_MD_CTX_free};
      BOOST_ASSERT(ctx != nullptr);
      BOOST_ASSERT(static_cast<size_t>(EVP_MD_get_size(md)) == out.size());

      unsigned int out_size = 0;
      // digest calls only fail on allocation errors or misconfigured md
      [[maybe_unused]] auto ok =
          EVP_DigestInit_ex(ctx.get(), md, nullptr) == 1
          and EVP_DigestUpdate(ctx.get(), data.data(), data.size()) == 1
          and EVP_DigestFinal_ex(ctx.get(), out.data(), &out_size) == 1;
      BOOST_ASSERT(ok and out_size == out.size());
      return out;
    }
  }  // namespace

  HasherImpl::Hash256 HasherImpl::blake2s_256(common::BufferView data) const {
    return digest256(EVP_blake2s256(), data);
  }

  HasherImpl::Hash256 HasherImpl::sha2_256(common::BufferView data) const {
    return digest256(EVP_sha256(), data);
  }

}  // namespace tessera::crypto
