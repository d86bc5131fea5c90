/**
 * @file csr_builder.cpp
 * @brief CSR construction with OpenSSL X509_REQ
 */

#include "zatca/crypto/csr_builder.h"
#include "zatca/crypto/openssl_types.h"
#include "zatca/common/base64.h"
#include "zatca/common/exceptions.h"

#include <openssl/pem.h>
#include <openssl/x509v3.h>

namespace zatca::crypto {

using common::CryptoException;
using common::CsrException;

namespace {

constexpr const char* kTemplateOid = "1.3.6.1.4.1.311.20.2";

void requireField(const std::string& value, const char* field) {
    if (value.empty()) {
        throw CsrException(std::string("missing required field: ") + field);
    }
}

void addNameEntry(X509_NAME* name, const char* field, const std::string& value) {
    if (X509_NAME_add_entry_by_txt(name, field, MBSTRING_UTF8,
            reinterpret_cast<const unsigned char*>(value.c_str()), -1, -1, 0) != 1) {
        throw CryptoException(drainOpenSslErrors(std::string("cannot add name entry ") + field));
    }
}

X509_EXTENSION* buildSubjectAltName(const CsrConfig& config) {
    X509_NAME* dir = X509_NAME_new();
    if (!dir) {
        throw CryptoException(drainOpenSslErrors("X509_NAME_new failed"));
    }

    try {
        addNameEntry(dir, "SN", config.serialNumber);
        if (!config.organizationIdentifier.empty()) {
            addNameEntry(dir, "UID", config.organizationIdentifier);
        }
        addNameEntry(dir, "title", config.invoiceType);
        addNameEntry(dir, "registeredAddress", config.location);
        addNameEntry(dir, "businessCategory", config.industry);
    } catch (const CryptoException&) {
        X509_NAME_free(dir);
        throw;
    }

    GENERAL_NAME* gn = GENERAL_NAME_new();
    GENERAL_NAMES* names = sk_GENERAL_NAME_new_null();
    if (!gn || !names) {
        X509_NAME_free(dir);
        GENERAL_NAME_free(gn);
        sk_GENERAL_NAME_free(names);
        throw CryptoException(drainOpenSslErrors("GENERAL_NAMES allocation failed"));
    }
    GENERAL_NAME_set0_value(gn, GEN_DIRNAME, dir);
    sk_GENERAL_NAME_push(names, gn);

    X509_EXTENSION* ext = X509V3_EXT_i2d(NID_subject_alt_name, 0, names);
    GENERAL_NAMES_free(names);
    if (!ext) {
        throw CryptoException(drainOpenSslErrors("subjectAltName encoding failed"));
    }
    return ext;
}

X509_EXTENSION* buildTemplateExtension(const std::string& templateName) {
    ASN1_OBJECT* oid = OBJ_txt2obj(kTemplateOid, 1);
    ASN1_STRING* printable = ASN1_STRING_type_new(V_ASN1_PRINTABLESTRING);
    ASN1_OCTET_STRING* octets = ASN1_OCTET_STRING_new();
    X509_EXTENSION* ext = nullptr;

    if (oid && printable && octets &&
        ASN1_STRING_set(printable, templateName.data(), static_cast<int>(templateName.size())) == 1) {
        unsigned char* der = nullptr;
        int derLen = i2d_ASN1_PRINTABLESTRING(printable, &der);
        if (derLen > 0 && ASN1_OCTET_STRING_set(octets, der, derLen) == 1) {
            ext = X509_EXTENSION_create_by_OBJ(nullptr, oid, 0, octets);
        }
        OPENSSL_free(der);
    }

    ASN1_OBJECT_free(oid);
    ASN1_STRING_free(printable);
    ASN1_OCTET_STRING_free(octets);

    if (!ext) {
        throw CryptoException(drainOpenSslErrors("certificate template extension encoding failed"));
    }
    return ext;
}

std::string readTemplateName(X509_REQ* req) {
    STACK_OF(X509_EXTENSION)* exts = X509_REQ_get_extensions(req);
    if (!exts) return "";

    std::string result;
    ASN1_OBJECT* oid = OBJ_txt2obj(kTemplateOid, 1);
    for (int i = 0; i < sk_X509_EXTENSION_num(exts); i++) {
        X509_EXTENSION* ext = sk_X509_EXTENSION_value(exts, i);
        if (OBJ_cmp(X509_EXTENSION_get_object(ext), oid) != 0) continue;

        ASN1_OCTET_STRING* data = X509_EXTENSION_get_data(ext);
        const unsigned char* p = ASN1_STRING_get0_data(data);
        ASN1_PRINTABLESTRING* value = d2i_ASN1_PRINTABLESTRING(nullptr, &p, ASN1_STRING_length(data));
        if (value) {
            result.assign(reinterpret_cast<const char*>(ASN1_STRING_get0_data(value)),
                          static_cast<size_t>(ASN1_STRING_length(value)));
            ASN1_PRINTABLESTRING_free(value);
        }
        break;
    }
    ASN1_OBJECT_free(oid);
    sk_X509_EXTENSION_pop_free(exts, X509_EXTENSION_free);
    return result;
}

} // namespace

std::string certificateTemplateName(common::ZatcaEnvironment environment) {
    switch (environment) {
        case common::ZatcaEnvironment::SANDBOX:    return "TSTZATCA-Code-Signing";
        case common::ZatcaEnvironment::SIMULATION: return "PREZATCA-Code-Signing";
        case common::ZatcaEnvironment::PRODUCTION: return "ZATCA-Code-Signing";
    }
    return "TSTZATCA-Code-Signing";
}

std::string generateCsr(const CsrConfig& config,
                        const std::string& privateKeyPem,
                        common::ZatcaEnvironment environment) {
    requireField(config.commonName, "commonName");
    requireField(config.serialNumber, "serialNumber");
    requireField(config.organizationName, "organizationName");
    requireField(config.countryName, "countryName");
    requireField(config.invoiceType, "invoiceType");
    requireField(config.location, "location");
    requireField(config.industry, "industry");
    if (config.countryName.size() != 2) {
        throw CsrException("countryName must be a 2-letter ISO code: " + config.countryName);
    }

    UniqueKey key = loadPrivateKeyPem(privateKeyPem);

    UniqueReq req(X509_REQ_new());
    if (!req || X509_REQ_set_version(req.get(), 0) != 1) {
        throw CryptoException(drainOpenSslErrors("X509_REQ_new failed"));
    }

    // Subject order C, OU, O, CN
    X509_NAME* subject = X509_REQ_get_subject_name(req.get());
    std::string unit = config.organizationUnitName.value_or("");
    addNameEntry(subject, "C", config.countryName);
    addNameEntry(subject, "OU", unit.empty() ? config.organizationName : unit);
    addNameEntry(subject, "O", config.organizationName);
    addNameEntry(subject, "CN", config.commonName);

    STACK_OF(X509_EXTENSION)* exts = sk_X509_EXTENSION_new_null();
    if (!exts) {
        throw CryptoException(drainOpenSslErrors("extension stack allocation failed"));
    }
    try {
        sk_X509_EXTENSION_push(exts, buildTemplateExtension(certificateTemplateName(environment)));
        sk_X509_EXTENSION_push(exts, buildSubjectAltName(config));
    } catch (const CryptoException&) {
        sk_X509_EXTENSION_pop_free(exts, X509_EXTENSION_free);
        throw;
    }
    int added = X509_REQ_add_extensions(req.get(), exts);
    sk_X509_EXTENSION_pop_free(exts, X509_EXTENSION_free);
    if (added != 1) {
        throw CryptoException(drainOpenSslErrors("X509_REQ_add_extensions failed"));
    }

    if (X509_REQ_set_pubkey(req.get(), key.get()) != 1) {
        throw CryptoException(drainOpenSslErrors("X509_REQ_set_pubkey failed"));
    }
    if (X509_REQ_sign(req.get(), key.get(), EVP_sha256()) <= 0) {
        throw CryptoException(drainOpenSslErrors("CSR signing failed"));
    }

    UniqueBio bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_X509_REQ(bio.get(), req.get()) != 1) {
        throw CryptoException(drainOpenSslErrors("CSR PEM export failed"));
    }

    return common::Base64::encode(bioToString(bio.get()));
}

CsrInfo inspectCsr(const std::string& csrB64) {
    std::string pem = common::Base64::decodeToString(csrB64);

    UniqueBio bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    UniqueReq req(bio ? PEM_read_bio_X509_REQ(bio.get(), nullptr, nullptr, nullptr) : nullptr);
    if (!req) {
        throw common::ParsingException(drainOpenSslErrors("not a PEM certificate request"));
    }

    CsrInfo info;

    UniqueBio nameBio(BIO_new(BIO_s_mem()));
    X509_NAME_print_ex(nameBio.get(), X509_REQ_get_subject_name(req.get()), 0, XN_FLAG_RFC2253);
    info.subject = bioToString(nameBio.get());

    unsigned char* der = nullptr;
    int derLen = i2d_re_X509_REQ_tbs(req.get(), &der);
    if (derLen > 0) {
        info.requestInfoDer.assign(der, der + derLen);
    }
    OPENSSL_free(der);

    info.templateName = readTemplateName(req.get());

    UniqueKey pub(X509_REQ_get_pubkey(req.get()));
    info.signatureValid = pub && X509_REQ_verify(req.get(), pub.get()) == 1;
    ERR_clear_error();

    return info;
}

} // namespace zatca::crypto
