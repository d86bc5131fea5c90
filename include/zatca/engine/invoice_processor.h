/**
 * @file invoice_processor.h
 * @brief End-to-end invoice flow
 *
 * validate -> sequence (build + hash) -> sign -> QR -> submit -> record status.
 * Invalid invoices and expired credentials are rejected before an ICV is
 * consumed. Once sequenced, an invoice always leaves a chain entry:
 * accepted (CLEARED / REPORTED), REJECTED, VOID, or ISSUED while its
 * submission outcome is unknown (transport failure; see resubmit()).
 *
 * Compliance-mode invoices are sequenced on a separate chain per
 * organization (complianceChainId()) and never count as accepted.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "zatca/api/api_types.h"
#include "zatca/api/submission_client.h"
#include "zatca/chain/chain_sequencer.h"
#include "zatca/invoice/invoice_types.h"
#include "zatca/invoice/invoice_validator.h"

namespace zatca::engine {

/// @brief Chain holding an organization's compliance-phase test invoices
std::string complianceChainId(const std::string& orgId);

/**
 * @brief Key and certificate used to sign invoices
 */
struct SigningIdentity {
    std::string privateKeyPem;
    std::string certificate;   ///< binarySecurityToken or PEM; may be empty before onboarding

    /**
     * @brief Derive the QR public key and certificate signature
     * @throws CryptoException / ParsingException on malformed material
     */
    void resolve();

    std::string publicKey;       ///< Base64 SPKI (QR tag 8)
    std::string certSignature;   ///< Base64 certificate signature (QR tag 9)
    std::string certificateDer;  ///< Base64 DER (ds:X509Certificate); empty before onboarding
};

struct ProcessedInvoice {
    bool accepted = false;          ///< Invoice legally cleared/reported
    bool compliancePassed = false;  ///< Compliance-mode submission passed validation
    bool requiresReview = false;    ///< Warnings present (local or regulator)

    invoice::InvoiceValidationResult validation;
    std::optional<chain::ChainEntry> entry;  ///< Absent when rejected before sequencing

    std::string xml;              ///< Unsigned invoice; invoiceHash is computed over it
    std::string signedXml;        ///< xml with the enveloped signature and QR; the submitted body
    std::string invoiceHash;
    std::string signature;
    std::string qrCode;           ///< Regulator QR when returned, otherwise local Phase-2 QR
    std::optional<std::string> clearedInvoice;

    invoice::InvoiceKind kind = invoice::InvoiceKind::STANDARD;
    api::SubmissionMode mode = api::SubmissionMode::CLEARANCE;
    api::SubmissionResult submission;
};

class InvoiceProcessor {
public:
    /**
     * @param sequencer Chain sequencer (non-owning)
     * @param client Submission client (non-owning)
     * @param identity Signing identity; resolved on construction
     * @throws CryptoException / ParsingException on malformed identity
     */
    InvoiceProcessor(chain::ChainSequencer* sequencer,
                     api::SubmissionClient* client,
                     SigningIdentity identity);

    /**
     * @brief Process a full invoice
     * @param mode Defaults to clearance for standard and reporting for simplified invoices
     */
    ProcessedInvoice process(const std::string& orgId,
                             invoice::InvoiceRequest request,
                             const api::Credential& credential,
                             std::optional<api::SubmissionMode> mode = std::nullopt);

    ProcessedInvoice processSimplified(const std::string& orgId,
                                       const invoice::SimplifiedInvoiceData& data,
                                       const api::Credential& credential,
                                       std::optional<api::SubmissionMode> mode = std::nullopt);

    /**
     * @brief Resend a sequenced invoice whose submission outcome was unknown
     *
     * Sends the identical hash, UUID and XML; never re-renders.
     */
    ProcessedInvoice resubmit(const ProcessedInvoice& previous, const api::Credential& credential);

    /**
     * @brief Terminate a sequenced invoice that will not be submitted
     */
    void voidInvoice(const std::string& orgId, int64_t icv);

private:
    void submitAndRecord(ProcessedInvoice& result, const api::Credential& credential);

    chain::ChainSequencer* sequencer_;
    api::SubmissionClient* client_;
    SigningIdentity identity_;
};

} // namespace zatca::engine
