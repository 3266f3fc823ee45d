#pragma once

enum class KeyType
{
    Public,
    Private
};

enum class Encoding
{
    PEM,
    DER,
};

using BigNum = struct bignum_st;
using Bio = struct bio_st;
using Hash = struct evp_md_st;
using HashCtx = struct evp_md_ctx_st;
using Key = struct evp_pkey_st;
using KeyCtx = struct evp_pkey_ctx_st;
using ParamBld = struct ossl_param_bld_st;
using Param = struct ossl_param_st;
