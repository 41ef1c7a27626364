/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/sha/sha256.hpp"

#include <boost/assert.hpp>
#include <openssl/evp.h>

namespace decai::crypto {
  common::Hash256 sha256(std::string_view input) {
    return sha256(
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        {reinterpret_cast<const uint8_t *>(input.data()), input.size()});
  }

  common::Hash256 sha256(std::span<const uint8_t> input) {
    common::Hash256 out;
    unsigned int out_size = 0;
    BOOST_VERIFY(EVP_Digest(input.data(),
                            input.size(),
                            out.data(),
                            &out_size,
                            EVP_sha256(),
                            nullptr)
                 == 1);
    BOOST_ASSERT(out_size == out.size());
    return out;
  }
}  // namespace decai::crypto
