/**
 * @file json_mapping.h
 * @brief JSON mapping of engine inputs and results for the REST service
 *
 * Request parsers throw ParsingException on structurally invalid input
 * (wrong JSON types); business validation stays in validateInvoice().
 */

#pragma once

#include <json/json.h>

#include "zatca/api/api_types.h"
#include "zatca/chain/chain_types.h"
#include "zatca/crypto/csr_builder.h"
#include "zatca/engine/invoice_processor.h"
#include "zatca/invoice/invoice_types.h"

namespace zatca::engine {

invoice::InvoiceRequest invoiceRequestFromJson(const Json::Value& json);

/// @brief {csid, secret, expiresAt?, requestId?}
api::Credential credentialFromJson(const Json::Value& json);

crypto::CsrConfig csrConfigFromJson(const Json::Value& json);

Json::Value toJson(const api::ApiMessage& message);
Json::Value toJson(const api::SubmissionResult& result);
Json::Value toJson(const api::CsidResult& result);
Json::Value toJson(const chain::ChainEntry& entry);
Json::Value toJson(const chain::ChainVerification& verification);
Json::Value toJson(const ProcessedInvoice& processed);

} // namespace zatca::engine
