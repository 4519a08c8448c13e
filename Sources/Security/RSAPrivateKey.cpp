/**
 * SPDX-FileCopyrightText: 2024-2026 Sebastien Jodogne, EPL UCLouvain, Belgium
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

/**
 * Orthanc LTI Tool
 * Copyright (C) 2024-2026 Sebastien Jodogne, EPL UCLouvain, Belgium
 *
 * This program is free software: you can redistribute it and/or
 * modify it under the terms of the GNU Affero General Public License
 * as published by the Free Software Foundation, either version 3 of
 * the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <http://www.gnu.org/licenses/>.
 **/


#include "RSAPrivateKey.h"

#include "../HttpToolbox.h"
#include "OpenSSLSerializationContext.h"
#include "SecurityConstants.h"

#include <Toolbox.h>

#include <openssl/core_names.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>


void RSAPrivateKey::GetParameter(std::string& target,
                                 const char* name) const
{
  if (!IsValid())
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_BadSequenceOfCalls, "No RSA private key is loaded");
  }

  PointerRAII<BIGNUM> bignum(BN_free);
  if (!EVP_PKEY_get_bn_param(key_.GetValue(), name, &bignum.GetValue()) ||
      bignum.IsNull())
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_InternalError, "Cannot read parameter of RSA key: " + std::string(name));
  }

  const int size = BN_num_bytes(bignum.GetValue());
  if (size <= 0)
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_InternalError);
  }

  target.resize(size);
  if (BN_bn2bin(bignum.GetValue(), reinterpret_cast<unsigned char*>(&target[0])) != size)
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_InternalError);
  }
}


void RSAPrivateKey::Generate(unsigned int bits)
{
  key_.Clear();

  PointerRAII<EVP_PKEY_CTX> context(EVP_PKEY_CTX_free);
  context.Assign(EVP_PKEY_CTX_new_from_name(NULL, "RSA", NULL));

  if (EVP_PKEY_keygen_init(context.GetValue()) != 1 ||
      EVP_PKEY_CTX_set_rsa_keygen_bits(context.GetValue(), bits) != 1 ||
      EVP_PKEY_generate(context.GetValue(), &key_.GetValue()) != 1)
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_InternalError, "Cannot generate a RSA key");
  }
}


void RSAPrivateKey::SerializePrivate(std::string& pem) const
{
  if (!IsValid())
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_BadSequenceOfCalls, "No RSA private key is loaded");
  }

  OpenSSLSerializationContext context;

  if (!PEM_write_bio_PrivateKey(context.GetValue(), key_.GetValue(), NULL, NULL, 0, NULL, NULL))
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_InternalError, "Failed to write private key to BIO");
  }

  context.Write(pem);
}


void RSAPrivateKey::SerializePublic(std::string& pem) const
{
  if (!IsValid())
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_BadSequenceOfCalls, "No RSA private key is loaded");
  }

  OpenSSLSerializationContext context;

  if (!PEM_write_bio_PUBKEY(context.GetValue(), key_.GetValue()))
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_InternalError, "Failed to write public key to BIO");
  }

  context.Write(pem);
}


void RSAPrivateKey::Unserialize(const std::string& pem)
{
  key_.Clear();

  if (pem.empty())
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_BadFileFormat, "Empty PEM");
  }

  PointerRAII<BIO> bio(BIO_free, 1 /* success code of BIO_free() */);
  bio.Assign(BIO_new_mem_buf(pem.c_str(), pem.size()));

  EVP_PKEY* key = PEM_read_bio_PrivateKey(bio.GetValue(), NULL, NULL, NULL);
  if (key == NULL)
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_BadFileFormat, "The PEM does not contain a private key");
  }

  key_.Assign(key);

  if (EVP_PKEY_base_id(key_.GetValue()) != EVP_PKEY_RSA)
  {
    key_.Clear();
    throw Orthanc::OrthancException(Orthanc::ErrorCode_BadFileFormat, "The PEM does not contain a RSA private key");
  }

  PointerRAII<EVP_PKEY_CTX> context(EVP_PKEY_CTX_free);
  context.Assign(EVP_PKEY_CTX_new(key_.GetValue(), NULL));

  if (EVP_PKEY_private_check(context.GetValue()) != 1)
  {
    key_.Clear();
    throw Orthanc::OrthancException(Orthanc::ErrorCode_BadFileFormat, "The RSA private key is inconsistent");
  }
}


void RSAPrivateKey::SignRS256(std::string& signature,
                              const std::string& buffer) const
{
  if (!IsValid())
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_BadSequenceOfCalls, "No RSA private key is loaded");
  }

  PointerRAII<EVP_MD_CTX> context(EVP_MD_CTX_free);
  context.Assign(EVP_MD_CTX_new());

  size_t size;

  if (EVP_DigestSignInit(context.GetValue(), NULL, EVP_sha256(), NULL, key_.GetValue()) != 1 ||
      EVP_DigestSignUpdate(context.GetValue(), buffer.empty() ? NULL : buffer.c_str(), buffer.size()) != 1 ||
      EVP_DigestSignFinal(context.GetValue(), NULL, &size) != 1)
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_InternalError, "Cannot sign a memory buffer");
  }

  signature.resize(size);

  if (size != 0 &&
      EVP_DigestSignFinal(context.GetValue(), reinterpret_cast<unsigned char*>(&signature[0]), &size) != 1)
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_InternalError, "Cannot sign a memory buffer");
  }

  signature.resize(size);
}


void RSAPrivateKey::ExportJwk(Json::Value& target,
                              const std::string& keyId) const
{
  std::string exponent, modulus;
  GetParameter(exponent, OSSL_PKEY_PARAM_RSA_E);
  GetParameter(modulus, OSSL_PKEY_PARAM_RSA_N);

  std::string encodedExponent, encodedModulus;
  HttpToolbox::EncodeBase64Url(encodedExponent, exponent);
  HttpToolbox::EncodeBase64Url(encodedModulus, modulus);

  target = Json::objectValue;
  target[JWKS_FIELD_KTY] = "RSA";
  target[JWKS_FIELD_ALG] = "RS256";
  target[JWKS_FIELD_USE] = "sig";
  target[JWKS_FIELD_KID] = keyId;
  target[JWKS_FIELD_E] = encodedExponent;
  target[JWKS_FIELD_N] = encodedModulus;
}


void RSAPrivateKey::ForgeJWT(std::string& jwt,
                             const std::string& keyId,
                             const Json::Value& payload) const
{
  if (payload.type() != Json::objectValue)
  {
    throw Orthanc::OrthancException(Orthanc::ErrorCode_BadParameterType, "The payload of a JWT must be a JSON object");
  }

  Json::Value header;
  header[JWKS_FIELD_TYP] = "JWT";
  header[JWKS_FIELD_ALG] = "RS256";

  if (!keyId.empty())
  {
    header[JWKS_FIELD_KID] = keyId;
  }

  std::string headerString, payloadString;
  Orthanc::Toolbox::WriteFastJson(headerString, header);
  Orthanc::Toolbox::WriteFastJson(payloadString, payload);

  std::string headerBase64, payloadBase64;
  HttpToolbox::EncodeBase64Url(headerBase64, headerString);
  HttpToolbox::EncodeBase64Url(payloadBase64, payloadString);

  const std::string message = headerBase64 + "." + payloadBase64;

  std::string signature;
  SignRS256(signature, message);

  std::string signatureBase64;
  HttpToolbox::EncodeBase64Url(signatureBase64, signature);

  jwt = message + "." + signatureBase64;
}
