#pragma once

#include <openssl/evp.h>
#include <openssl/bn.h>
#include <openssl/bio.h>
#include <openssl/params.h>
#include <openssl/param_build.h>

#include <onionid/crypto/typedefs.hpp>
#include <onionid/utils/custom_unique_ptr.hpp>

namespace onionid::crypto
{

DEFINE_CUSTOM_UNIQUE_PTR(BigNumPtr, BigNum, BN_free);
DEFINE_CUSTOM_UNIQUE_PTR(BioPtr, Bio, BIO_free_all);

DEFINE_CUSTOM_UNIQUE_PTR(KeyPtr, Key, EVP_PKEY_free);
DEFINE_CUSTOM_UNIQUE_PTR(KeyCtxPtr, KeyCtx, EVP_PKEY_CTX_free);
DEFINE_CUSTOM_UNIQUE_PTR(HashPtr, Hash, EVP_MD_free);
DEFINE_CUSTOM_UNIQUE_PTR(HashCtxPtr, HashCtx, EVP_MD_CTX_free);

DEFINE_CUSTOM_UNIQUE_PTR(ParamBldPtr, ParamBld, OSSL_PARAM_BLD_free);
DEFINE_CUSTOM_UNIQUE_PTR(ParamPtr, Param, OSSL_PARAM_free);

} // namespace onionid::crypto
