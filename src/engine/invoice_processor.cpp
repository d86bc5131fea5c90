/**
 * @file invoice_processor.cpp
 * @brief End-to-end invoice flow
 */

#include "zatca/engine/invoice_processor.h"
#include "zatca/api/response_mapper.h"
#include "zatca/common/exceptions.h"
#include "zatca/common/uuid.h"
#include "zatca/crypto/certificate_utils.h"
#include "zatca/crypto/crypto_core.h"
#include "zatca/crypto/phase2_qr.h"
#include "zatca/invoice/invoice_totals.h"
#include "zatca/invoice/xml_builder.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace zatca::engine {

using api::SubmissionMode;
using chain::EntryStatus;

namespace {

api::ApiMessage toApiMessage(const invoice::ValidationIssue& issue, const char* status) {
    api::ApiMessage msg;
    msg.type = api::MessageType::VALIDATION;
    msg.code = issue.code;
    msg.category = issue.category;
    msg.message = issue.message;
    msg.status = status;
    return msg;
}

ProcessedInvoice rejectedBeforeSequencing(SubmissionMode mode, invoice::InvoiceKind kind) {
    ProcessedInvoice result;
    result.mode = mode;
    result.kind = kind;
    result.submission.mode = mode;
    result.submission.success = false;
    result.submission.status = api::ValidationStatus::ERROR;
    return result;
}

} // namespace

std::string complianceChainId(const std::string& orgId) {
    return orgId + ":compliance";
}

void SigningIdentity::resolve() {
    if (!certificate.empty()) {
        auto cert = crypto::parseBinarySecurityToken(certificate);
        publicKey = crypto::certificatePublicKey(cert.get());
        certSignature = crypto::certificateSignature(cert.get());
        certificateDer = crypto::certificateDer(cert.get());
        if (!crypto::certificateMatchesKey(cert.get(), privateKeyPem)) {
            throw common::CryptoException("certificate does not match the signing key");
        }
        return;
    }

    // Pre-onboarding: no certificate yet, QR carries the bare SPKI body
    std::istringstream in(crypto::publicKeyFromPrivate(privateKeyPem));
    std::string line;
    publicKey.clear();
    while (std::getline(in, line)) {
        if (line.rfind("-----", 0) == 0) continue;
        publicKey += line;
    }
    certSignature.clear();
    certificateDer.clear();
}

InvoiceProcessor::InvoiceProcessor(chain::ChainSequencer* sequencer,
                                   api::SubmissionClient* client,
                                   SigningIdentity identity)
    : sequencer_(sequencer), client_(client), identity_(std::move(identity)) {
    if (!sequencer_ || !client_) {
        throw std::invalid_argument("InvoiceProcessor: sequencer and client are required");
    }
    identity_.resolve();
}

ProcessedInvoice InvoiceProcessor::process(const std::string& orgId,
                                           invoice::InvoiceRequest request,
                                           const api::Credential& credential,
                                           std::optional<SubmissionMode> mode) {
    const SubmissionMode submissionMode = mode.value_or(
        request.kind == invoice::InvoiceKind::SIMPLIFIED ? SubmissionMode::REPORTING
                                                         : SubmissionMode::CLEARANCE);
    if (request.uuid.empty()) {
        request.uuid = common::Uuid::generate();
    }

    // --- Pre-flight: nothing below consumes an ICV on failure ---
    invoice::InvoiceValidationResult validation = invoice::validateInvoice(request, false);
    if (!validation.valid) {
        spdlog::warn("[InvoiceProcessor] {} invoice {} rejected locally ({} errors)",
                     orgId, request.invoiceNumber, validation.errors.size());
        ProcessedInvoice result = rejectedBeforeSequencing(submissionMode, request.kind);
        for (const auto& issue : validation.errors) {
            result.submission.errors.push_back(toApiMessage(issue, "ERROR"));
        }
        for (const auto& issue : validation.warnings) {
            result.submission.warnings.push_back(toApiMessage(issue, "WARNING"));
        }
        result.validation = std::move(validation);
        return result;
    }

    if (credential.isExpired()) {
        spdlog::warn("[InvoiceProcessor] {} invoice {} not sequenced: credential expired",
                     orgId, request.invoiceNumber);
        ProcessedInvoice result = rejectedBeforeSequencing(submissionMode, request.kind);
        result.submission.errors.push_back(api::credentialExpiredMessage());
        result.validation = std::move(validation);
        return result;
    }

    // --- Sequence: ICV/PIH, render, hash, commit ---
    const std::string chainId = submissionMode == SubmissionMode::COMPLIANCE ? complianceChainId(orgId)
                                                                             : orgId;
    chain::SequencedInvoice sequenced = sequencer_->append(chainId,
        [&request](const chain::ChainSlot& slot) {
            invoice::InvoiceRequest slotted = request;
            slotted.invoiceCounterValue = slot.icv;
            slotted.previousInvoiceHash = slot.previousHash;
            return chain::RenderedInvoice{invoice::buildInvoiceXml(slotted), slotted.uuid};
        });

    ProcessedInvoice result;
    result.mode = submissionMode;
    result.kind = request.kind;
    result.validation = std::move(validation);
    result.entry = sequenced.entry;
    result.xml = std::move(sequenced.xml);
    result.invoiceHash = sequenced.entry.invoiceHash;

    // --- Sign and build the QR; a failure here voids the slot ---
    try {
        result.signature = crypto::sign(result.invoiceHash, identity_.privateKeyPem);

        invoice::InvoiceTotals totals = invoice::computeTotals(request.lineItems);
        result.qrCode = crypto::assemblePhase2Tlv(
            request.seller.name,
            request.seller.vatNumber,
            request.issueDate + "T" + request.issueTime,
            invoice::formatAmount(totals.taxInclusiveAmount),
            invoice::formatAmount(totals.taxAmount),
            result.invoiceHash,
            result.signature,
            identity_.publicKey,
            identity_.certSignature);

        invoice::InvoiceRequest slotted = request;
        slotted.invoiceCounterValue = sequenced.entry.icv;
        slotted.previousInvoiceHash = sequenced.entry.previousHash;

        invoice::InvoiceSignature embedded;
        embedded.invoiceHash = result.invoiceHash;
        embedded.signatureValue = result.signature;
        embedded.certificate = identity_.certificateDer;
        embedded.qrCode = result.qrCode;
        result.signedXml = invoice::buildSignedInvoiceXml(slotted, embedded);
    } catch (const common::ZatcaException& e) {
        spdlog::error("[InvoiceProcessor] {} ICV {} voided: {}", chainId, sequenced.entry.icv, e.what());
        sequencer_->markStatus(chainId, sequenced.entry.icv, EntryStatus::VOID);
        throw;
    }

    spdlog::info("[InvoiceProcessor] {} invoice {} sequenced as ICV {} (uuid={})",
                 chainId, request.invoiceNumber, sequenced.entry.icv, request.uuid);

    submitAndRecord(result, credential);
    return result;
}

ProcessedInvoice InvoiceProcessor::processSimplified(const std::string& orgId,
                                                     const invoice::SimplifiedInvoiceData& data,
                                                     const api::Credential& credential,
                                                     std::optional<SubmissionMode> mode) {
    return process(orgId, invoice::toInvoiceRequest(data), credential, mode);
}

ProcessedInvoice InvoiceProcessor::resubmit(const ProcessedInvoice& previous,
                                            const api::Credential& credential) {
    if (!previous.entry) {
        throw std::invalid_argument("InvoiceProcessor: invoice was never sequenced");
    }
    if (previous.entry->status != EntryStatus::ISSUED) {
        throw std::invalid_argument("InvoiceProcessor: ICV " + std::to_string(previous.entry->icv) +
                                    " already has outcome " + chain::entryStatusToString(previous.entry->status));
    }

    ProcessedInvoice result = previous;
    result.submission = api::SubmissionResult{};
    result.clearedInvoice.reset();
    submitAndRecord(result, credential);
    return result;
}

void InvoiceProcessor::voidInvoice(const std::string& orgId, int64_t icv) {
    sequencer_->markStatus(orgId, icv, EntryStatus::VOID);
}

void InvoiceProcessor::submitAndRecord(ProcessedInvoice& result, const api::Credential& credential) {
    chain::ChainEntry& entry = *result.entry;

    auto request = api::InvoiceSubmissionRequest::fromXml(result.invoiceHash, entry.uuid, result.signedXml);
    result.submission = client_->submit(result.mode, request, credential);

    const bool compliance = result.mode == SubmissionMode::COMPLIANCE;
    const bool transportFailure = !result.submission.errors.empty() &&
        std::all_of(result.submission.errors.begin(), result.submission.errors.end(),
                    [](const api::ApiMessage& m) { return m.isTransportFailure(); });

    if (result.submission.isClearable() && compliance) {
        entry.status = EntryStatus::COMPLIANCE_PASSED;
    } else if (result.submission.isClearable()) {
        entry.status = (result.kind == invoice::InvoiceKind::SIMPLIFIED) ? EntryStatus::REPORTED
                                                                  : EntryStatus::CLEARED;
    } else if (transportFailure) {
        // Outcome unknown: keep ISSUED so the same payload can be resent
        entry.status = EntryStatus::ISSUED;
    } else {
        entry.status = EntryStatus::REJECTED;
    }

    if (entry.status != EntryStatus::ISSUED) {
        sequencer_->markStatus(entry.orgId, entry.icv, entry.status);
    }

    result.accepted = result.submission.isClearable() && !compliance;
    result.compliancePassed = result.submission.isClearable() && compliance;
    if (result.submission.qrCode) {
        result.qrCode = *result.submission.qrCode;
    }
    result.clearedInvoice = result.submission.clearedInvoice;
    result.requiresReview = result.submission.requiresReview() || !result.validation.warnings.empty();
}

} // namespace zatca::engine
