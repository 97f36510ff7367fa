/* File: timestamp_client.cpp
Copyright (C) Basealt LLC,  2024
Author: Oleg Proskurin, <proskurinov@basealt.ru>

This program is free software; you can redistribute it and/or
modify it under the terms of the GNU Lesser General Public
License as published by the Free Software Foundation; either
version 3 of the License, or (at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
Lesser General Public License for more details.

You should have received a copy of the GNU Lesser General Public License
along with this program; if not, write to the Free Software Foundation,
Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.
*/

#include "timestamp_client.hpp"

#include <openssl/ts.h>

#include <future>
#include <stdexcept>
#include <thread>
#include <utility>

#include "hash_utils.hpp"
#include "openssl_types.hpp"
#include "tsa_errors.hpp"

namespace pdfseal::tsa {

using crypto::OpenSslLastError;

namespace {

constexpr size_t kNonceSize = 8;

struct PreparedRequest {
  BytesVector der;
  BytesVector imprint;
  crypto::Asn1IntegerPtr nonce;
};

PreparedRequest BuildRequest(const BytesVector &data) {
  const std::string func_name = "[TimestampClient] ";
  PreparedRequest res;
  res.imprint = crypto::Sha256(data);
  const crypto::TsReqPtr req(TS_REQ_new());
  const std::unique_ptr<TS_MSG_IMPRINT,
                        crypto::OsslDeleter<TS_MSG_IMPRINT, TS_MSG_IMPRINT_free>>
    msg_imprint(TS_MSG_IMPRINT_new());
  const std::unique_ptr<X509_ALGOR,
                        crypto::OsslDeleter<X509_ALGOR, X509_ALGOR_free>>
    algo(X509_ALGOR_new());
  if (!req || !msg_imprint || !algo) {
    throw TsaError(func_name + "allocation failed");
  }
  X509_ALGOR_set_md(algo.get(), EVP_sha256());
  const BytesVector nonce_bytes = crypto::RandomBytes(kNonceSize);
  const crypto::BignumPtr nonce_bn(BN_bin2bn(
    nonce_bytes.data(), static_cast<int>(nonce_bytes.size()), nullptr));
  if (nonce_bn) {
    res.nonce.reset(BN_to_ASN1_INTEGER(nonce_bn.get(), nullptr));
  }
  if (!res.nonce || TS_REQ_set_version(req.get(), 1) != 1 ||
      TS_MSG_IMPRINT_set_algo(msg_imprint.get(), algo.get()) != 1 ||
      TS_MSG_IMPRINT_set_msg(msg_imprint.get(), res.imprint.data(),
                             static_cast<int>(res.imprint.size())) != 1 ||
      TS_REQ_set_msg_imprint(req.get(), msg_imprint.get()) != 1 ||
      TS_REQ_set_nonce(req.get(), res.nonce.get()) != 1 ||
      TS_REQ_set_cert_req(req.get(), 1) != 1) {
    throw TsaError(func_name + "can't build the request " +
                   OpenSslLastError());
  }
  res.der = crypto::ToDer<TS_REQ>(req.get(), i2d_TS_REQ);
  return res;
}

BytesVector ExtractToken(const BytesVector &resp_der,
                         const PreparedRequest &request) {
  const std::string func_name = "[TimestampClient] ";
  const unsigned char *ptr = resp_der.data();
  const crypto::TsRespPtr resp(
    d2i_TS_RESP(nullptr, &ptr, static_cast<long>(resp_der.size())));
  if (!resp) {
    throw TsaError(func_name + "can't decode the response " +
                   OpenSslLastError());
  }
  const long status = ASN1_INTEGER_get(  // NOLINT(google-runtime-int)
    TS_STATUS_INFO_get0_status(TS_RESP_get_status_info(resp.get())));
  if (status != TS_STATUS_GRANTED && status != TS_STATUS_GRANTED_WITH_MODS) {
    throw TsaError(func_name + "request rejected, status " +
                   std::to_string(status));
  }
  PKCS7 *token = TS_RESP_get_token(resp.get());
  TS_TST_INFO *tst_info = TS_RESP_get_tst_info(resp.get());
  if (token == nullptr || tst_info == nullptr) {
    throw TsaError(func_name + "no token in the response");
  }
  const ASN1_INTEGER *nonce = TS_TST_INFO_get_nonce(tst_info);
  if (nonce == nullptr || ASN1_INTEGER_cmp(nonce, request.nonce.get()) != 0) {
    throw TsaError(func_name + "nonce mismatch");
  }
  TS_MSG_IMPRINT *imprint = TS_TST_INFO_get_msg_imprint(tst_info);
  const ASN1_OCTET_STRING *digest = TS_MSG_IMPRINT_get_msg(imprint);
  const X509_ALGOR *algo = TS_MSG_IMPRINT_get_algo(imprint);
  const ASN1_OBJECT *algo_obj = nullptr;
  X509_ALGOR_get0(&algo_obj, nullptr, nullptr, algo);
  if (digest == nullptr || OBJ_obj2nid(algo_obj) != NID_sha256 ||
      BytesVector(ASN1_STRING_get0_data(digest),
                  ASN1_STRING_get0_data(digest) + ASN1_STRING_length(digest)) !=
        request.imprint) {
    throw TsaError(func_name + "message imprint mismatch");
  }
  return crypto::ToDer<PKCS7>(token, i2d_PKCS7);
}

}  // namespace

TimestampClient::TimestampClient(std::shared_ptr<ITimestampAuthority> authority,
                                 std::chrono::milliseconds timeout)
  : authority_(std::move(authority)), timeout_(timeout) {
  if (!authority_) {
    throw std::invalid_argument("[TimestampClient] authority is null");
  }
  if (timeout_.count() <= 0) {
    throw std::invalid_argument("[TimestampClient] timeout must be positive");
  }
}

BytesVector TimestampClient::Timestamp(const BytesVector &data) const {
  const std::string func_name = "[TimestampClient::Timestamp] ";
  if (data.empty()) {
    throw std::invalid_argument(func_name + "nothing to timestamp");
  }
  const PreparedRequest request = BuildRequest(data);
  // the task owns copies of everything it touches, it may outlive this call
  std::packaged_task<BytesVector()> task(
    [authority = authority_, der = request.der]() {
      return authority->Respond(der);
    });
  auto future = task.get_future();
  std::thread(std::move(task)).detach();
  if (future.wait_for(timeout_) != std::future_status::ready) {
    throw TsaTimeoutError(func_name + "no response in " +
                          std::to_string(timeout_.count()) + " ms");
  }
  BytesVector resp_der;
  try {
    resp_der = future.get();
  } catch (const TsaError &) {
    throw;
  } catch (const std::exception &ex) {
    throw TsaError(func_name + ex.what());
  }
  return ExtractToken(resp_der, request);
}

crypto::TimestampFunc TimestampClient::AsTimestampFunc() const {
  return [authority = authority_, timeout = timeout_](const BytesVector &data) {
    return TimestampClient(authority, timeout).Timestamp(data);
  };
}

}  // namespace pdfseal::tsa
