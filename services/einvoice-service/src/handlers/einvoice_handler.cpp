/** @file einvoice_handler.cpp
 *  @brief EInvoiceHandler implementation
 */

#include "einvoice_handler.h"

#include <spdlog/spdlog.h>

#include "zatca/api/csid_client.h"
#include "zatca/chain/chain_sequencer.h"
#include "zatca/common/exceptions.h"
#include "zatca/crypto/csr_builder.h"
#include "zatca/engine/invoice_processor.h"
#include "zatca/engine/json_mapping.h"

namespace handlers {

using zatca::engine::toJson;

namespace {

std::string stringField(const Json::Value& json, const char* field) {
    return json.isMember(field) && json[field].isString() ? json[field].asString() : "";
}

drogon::HttpResponsePtr csidResponse(const zatca::api::CsidResult& result) {
    auto resp = drogon::HttpResponse::newHttpJsonResponse(toJson(result));
    if (!result.success) {
        resp->setStatusCode(result.httpStatus >= 400 && result.httpStatus < 500
                                ? drogon::k400BadRequest
                                : drogon::k502BadGateway);
    }
    return resp;
}

} // anonymous namespace

EInvoiceHandler::EInvoiceHandler(
    zatca::engine::InvoiceProcessor* invoiceProcessor,
    zatca::api::CsidClient* csidClient,
    zatca::chain::ChainSequencer* chainSequencer,
    std::string signingKeyPem,
    zatca::common::ZatcaEnvironment environment)
    : invoiceProcessor_(invoiceProcessor),
      csidClient_(csidClient),
      chainSequencer_(chainSequencer),
      signingKeyPem_(std::move(signingKeyPem)),
      environment_(environment) {

    if (!invoiceProcessor_ || !csidClient_ || !chainSequencer_) {
        throw std::invalid_argument("EInvoiceHandler: service pointers cannot be nullptr");
    }

    spdlog::info("[EInvoiceHandler] Initialized (environment={})",
                 zatca::common::environmentToString(environment_));
}

drogon::HttpResponsePtr EInvoiceHandler::errorResponse(drogon::HttpStatusCode code, const std::string& message) {
    Json::Value error;
    error["success"] = false;
    error["error"] = message;
    auto resp = drogon::HttpResponse::newHttpJsonResponse(error);
    resp->setStatusCode(code);
    return resp;
}

void EInvoiceHandler::registerRoutes(drogon::HttpAppFramework& app) {
    // POST /api/einvoice/csr
    app.registerHandler(
        "/api/einvoice/csr",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleCsr(req, std::move(callback));
        },
        {drogon::Post}
    );

    // POST /api/einvoice/csid/compliance
    app.registerHandler(
        "/api/einvoice/csid/compliance",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleComplianceCsid(req, std::move(callback));
        },
        {drogon::Post}
    );

    // POST /api/einvoice/csid/production
    app.registerHandler(
        "/api/einvoice/csid/production",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleProductionCsid(req, std::move(callback));
        },
        {drogon::Post}
    );

    // POST /api/einvoice/csid/renew
    app.registerHandler(
        "/api/einvoice/csid/renew",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleRenewCsid(req, std::move(callback));
        },
        {drogon::Post}
    );

    // POST /api/einvoice/invoices/{mode}
    app.registerHandler(
        "/api/einvoice/invoices/{mode}",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback,
               const std::string& mode) {
            handleInvoice(req, std::move(callback), mode);
        },
        {drogon::Post}
    );

    // GET /api/einvoice/chain/{organizationId}/verify
    app.registerHandler(
        "/api/einvoice/chain/{organizationId}/verify",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback,
               const std::string& organizationId) {
            handleVerifyChain(req, std::move(callback), organizationId);
        },
        {drogon::Get}
    );

    spdlog::info("[EInvoiceHandler] Routes registered");
}

void EInvoiceHandler::handleCsr(
    const drogon::HttpRequestPtr& req,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    auto json = req->getJsonObject();
    if (!json || !json->isObject()) {
        callback(errorResponse(drogon::k400BadRequest, "Invalid JSON body"));
        return;
    }

    try {
        auto config = zatca::engine::csrConfigFromJson(*json);
        std::string csr = zatca::crypto::generateCsr(config, signingKeyPem_, environment_);

        Json::Value result;
        result["success"] = true;
        result["csr"] = csr;
        result["templateName"] = zatca::crypto::certificateTemplateName(environment_);
        callback(drogon::HttpResponse::newHttpJsonResponse(result));

    } catch (const zatca::common::CsrException& e) {
        callback(errorResponse(drogon::k400BadRequest, e.what()));
    } catch (const zatca::common::ParsingException& e) {
        callback(errorResponse(drogon::k400BadRequest, e.what()));
    } catch (const std::exception& e) {
        spdlog::error("[EInvoiceHandler] CSR generation failed: {}", e.what());
        callback(errorResponse(drogon::k500InternalServerError, e.what()));
    }
}

void EInvoiceHandler::handleComplianceCsid(
    const drogon::HttpRequestPtr& req,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    auto json = req->getJsonObject();
    if (!json || !json->isObject()) {
        callback(errorResponse(drogon::k400BadRequest, "Invalid JSON body"));
        return;
    }

    std::string csr = stringField(*json, "csr");
    std::string otp = stringField(*json, "otp");
    if (csr.empty() || otp.empty()) {
        callback(errorResponse(drogon::k400BadRequest, "csr and otp are required"));
        return;
    }

    callback(csidResponse(csidClient_->requestComplianceCsid(csr, otp)));
}

void EInvoiceHandler::handleProductionCsid(
    const drogon::HttpRequestPtr& req,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    auto json = req->getJsonObject();
    if (!json || !json->isObject()) {
        callback(errorResponse(drogon::k400BadRequest, "Invalid JSON body"));
        return;
    }

    std::string csid = stringField(*json, "csid");
    std::string secret = stringField(*json, "secret");
    std::string requestId = stringField(*json, "complianceRequestId");
    if (csid.empty() || secret.empty() || requestId.empty()) {
        callback(errorResponse(drogon::k400BadRequest, "csid, secret and complianceRequestId are required"));
        return;
    }

    callback(csidResponse(csidClient_->requestProductionCsid(csid, secret, requestId)));
}

void EInvoiceHandler::handleRenewCsid(
    const drogon::HttpRequestPtr& req,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    auto json = req->getJsonObject();
    if (!json || !json->isObject()) {
        callback(errorResponse(drogon::k400BadRequest, "Invalid JSON body"));
        return;
    }

    std::string csid = stringField(*json, "csid");
    std::string secret = stringField(*json, "secret");
    std::string csr = stringField(*json, "csr");
    std::string otp = stringField(*json, "otp");
    if (csid.empty() || secret.empty() || csr.empty() || otp.empty()) {
        callback(errorResponse(drogon::k400BadRequest, "csid, secret, csr and otp are required"));
        return;
    }

    callback(csidResponse(csidClient_->renewProductionCsid(csid, secret, csr, otp)));
}

void EInvoiceHandler::handleInvoice(
    const drogon::HttpRequestPtr& req,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback,
    const std::string& mode) {

    zatca::api::SubmissionMode submissionMode;
    if (mode == "clearance") {
        submissionMode = zatca::api::SubmissionMode::CLEARANCE;
    } else if (mode == "reporting") {
        submissionMode = zatca::api::SubmissionMode::REPORTING;
    } else if (mode == "compliance") {
        submissionMode = zatca::api::SubmissionMode::COMPLIANCE;
    } else {
        callback(errorResponse(drogon::k404NotFound, "Unknown submission mode: " + mode));
        return;
    }

    auto json = req->getJsonObject();
    if (!json || !json->isObject()) {
        callback(errorResponse(drogon::k400BadRequest, "Invalid JSON body"));
        return;
    }

    std::string orgId = stringField(*json, "organizationId");
    if (orgId.empty()) {
        callback(errorResponse(drogon::k400BadRequest, "organizationId is required"));
        return;
    }

    try {
        auto credential = zatca::engine::credentialFromJson((*json)["credential"]);
        auto request = zatca::engine::invoiceRequestFromJson((*json)["invoice"]);

        spdlog::info("[EInvoiceHandler] POST /api/einvoice/invoices/{} org={} number={}",
                     mode, orgId, request.invoiceNumber);

        auto processed = invoiceProcessor_->process(orgId, std::move(request), credential, submissionMode);

        Json::Value result = toJson(processed);
        result["success"] = processed.accepted || processed.compliancePassed;
        if (!processed.validation.valid) {
            Json::Value errors = Json::arrayValue;
            for (const auto& issue : processed.validation.errors) {
                Json::Value e;
                e["code"] = issue.code;
                e["category"] = issue.category;
                e["message"] = issue.message;
                errors.append(e);
            }
            result["validationErrors"] = errors;
        }

        auto resp = drogon::HttpResponse::newHttpJsonResponse(result);
        if (!processed.accepted && !processed.compliancePassed) {
            bool outcomeUnknown = processed.entry &&
                                  processed.entry->status == zatca::chain::EntryStatus::ISSUED;
            resp->setStatusCode(outcomeUnknown ? drogon::k503ServiceUnavailable
                                               : drogon::k422UnprocessableEntity);
        }
        callback(resp);

    } catch (const zatca::common::ParsingException& e) {
        callback(errorResponse(drogon::k400BadRequest, e.what()));
    } catch (const zatca::common::ChainException& e) {
        spdlog::error("[EInvoiceHandler] Chain sequencing failed for org={}: {}", orgId, e.what());
        callback(errorResponse(drogon::k409Conflict, e.what()));
    } catch (const std::exception& e) {
        spdlog::error("[EInvoiceHandler] Invoice processing failed for org={}: {}", orgId, e.what());
        callback(errorResponse(drogon::k500InternalServerError, e.what()));
    }
}

void EInvoiceHandler::handleVerifyChain(
    const drogon::HttpRequestPtr& /* req */,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback,
    const std::string& organizationId) {

    try {
        auto verification = chainSequencer_->verify(organizationId);
        Json::Value result = toJson(verification);
        result["success"] = true;
        result["organizationId"] = organizationId;
        callback(drogon::HttpResponse::newHttpJsonResponse(result));

    } catch (const std::exception& e) {
        spdlog::error("[EInvoiceHandler] Chain verification failed for org={}: {}", organizationId, e.what());
        callback(errorResponse(drogon::k500InternalServerError, e.what()));
    }
}

} // namespace handlers
