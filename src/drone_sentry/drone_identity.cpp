#include "drone_sentry/drone_identity.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>
#include <openssl/bio.h>
#include <openssl/pem.h>

#include "drone_sentry/id_generator.hpp"
#include "drone_sentry/logging.hpp"

namespace drone_sentry {

namespace {

constexpr std::size_t k_operator_secret_bytes{32};
constexpr std::size_t k_operator_salt_bytes{16};
constexpr std::string_view k_zero_mac{"00:00:00:00:00:00"};
constexpr std::string_view k_timing_decoy_salt{"00000000000000000000000000000000"};

struct BioDeleter final {
    void operator()(BIO* bio) const noexcept { BIO_free_all(bio); }
};
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

struct KeyContextDeleter final {
    void operator()(EVP_PKEY_CTX* context) const noexcept { EVP_PKEY_CTX_free(context); }
};
using KeyContextPtr = std::unique_ptr<EVP_PKEY_CTX, KeyContextDeleter>;

struct DigestContextDeleter final {
    void operator()(EVP_MD_CTX* context) const noexcept { EVP_MD_CTX_free(context); }
};
using DigestContextPtr = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

std::string trim(std::string text) {
    const auto is_junk = [](unsigned char value) { return std::isspace(value) != 0 || value == '\0'; };
    while (!text.empty() && is_junk(static_cast<unsigned char>(text.back()))) {
        text.pop_back();
    }
    const auto first = std::find_if_not(text.begin(), text.end(), [&](char value) {
        return is_junk(static_cast<unsigned char>(value));
    });
    text.erase(text.begin(), first);
    return text;
}

std::optional<std::string> read_file(const std::filesystem::path& file_path) {
    std::ifstream stream(file_path, std::ios::binary);
    if (!stream) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << stream.rdbuf();
    return buffer.str();
}

/** @brief Write a file, restricting it to owner read/write before any content lands. */
Status write_file(const std::filesystem::path& file_path, std::string_view content, bool owner_only) {
    if (owner_only) {
        std::ofstream placeholder(file_path, std::ios::binary | std::ios::trunc);
        if (!placeholder) {
            return make_error(ErrorKind::IoFailure, "Unable to create " + file_path.string());
        }
        placeholder.close();
        std::error_code error;
        std::filesystem::permissions(
            file_path,
            std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
            std::filesystem::perm_options::replace,
            error
        );
        if (error) {
            return make_error(ErrorKind::IoFailure, "Unable to restrict " + file_path.string() + ": " + error.message());
        }
    }
    std::ofstream stream(file_path, std::ios::binary | std::ios::trunc);
    stream.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!stream) {
        return make_error(ErrorKind::IoFailure, "Unable to write " + file_path.string());
    }
    return Status::success();
}

std::string bio_contents(BIO* bio) {
    char* data = nullptr;
    const long length = BIO_get_mem_data(bio, &data);
    return length > 0 ? std::string(data, static_cast<std::size_t>(length)) : std::string{};
}

Result<std::string> private_key_to_pem(EVP_PKEY* key) {
    BioPtr bio{BIO_new(BIO_s_mem())};
    if (!bio || PEM_write_bio_PrivateKey(bio.get(), key, nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        return make_error(ErrorKind::CryptoFailure, "Unable to encode private key");
    }
    return bio_contents(bio.get());
}

Result<std::string> public_key_to_pem(EVP_PKEY* key) {
    BioPtr bio{BIO_new(BIO_s_mem())};
    if (!bio || PEM_write_bio_PUBKEY(bio.get(), key) != 1) {
        return make_error(ErrorKind::CryptoFailure, "Unable to encode public key");
    }
    return bio_contents(bio.get());
}

Result<PrivateKeyPtr> generate_ed25519_key() {
    KeyContextPtr context{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr)};
    EVP_PKEY* raw_key = nullptr;
    if (!context || EVP_PKEY_keygen_init(context.get()) != 1 || EVP_PKEY_keygen(context.get(), &raw_key) != 1) {
        return make_error(ErrorKind::CryptoFailure, "Ed25519 key generation failed");
    }
    return PrivateKeyPtr{raw_key};
}

std::optional<std::string> first_hardware_mac(const std::filesystem::path& net_root) {
    std::error_code error;
    if (!std::filesystem::is_directory(net_root, error)) {
        return std::nullopt;
    }
    std::vector<std::filesystem::path> list_interfaces;
    for (const auto& entry : std::filesystem::directory_iterator(net_root, error)) {
        list_interfaces.push_back(entry.path());
    }
    std::sort(list_interfaces.begin(), list_interfaces.end());
    for (const auto& interface_dir : list_interfaces) {
        if (interface_dir.filename() == "lo") {
            continue;
        }
        const auto mac = read_file(interface_dir / "address");
        if (!mac) {
            continue;
        }
        const std::string str_mac = trim(*mac);
        if (!str_mac.empty() && str_mac != k_zero_mac) {
            return str_mac;
        }
    }
    return std::nullopt;
}

}  // namespace

DroneIdentity::DroneIdentity(
    std::filesystem::path identity_dir,
    std::shared_ptr<IdGenerator> id_generator,
    std::filesystem::path system_root
)
    : identity_dir_(std::move(identity_dir)),
      system_root_(std::move(system_root)),
      id_generator_(std::move(id_generator)),
      logger_(get_logger()) {
    if (!id_generator_) {
        throw std::invalid_argument("DroneIdentity requires an id generator");
    }
}

Result<std::shared_ptr<DroneIdentity>> DroneIdentity::open(
    std::filesystem::path identity_dir,
    std::shared_ptr<IdGenerator> id_generator,
    std::filesystem::path system_root
) {
    std::shared_ptr<DroneIdentity> identity{
        new DroneIdentity(std::move(identity_dir), std::move(id_generator), std::move(system_root))
    };
    std::error_code error;
    if (std::filesystem::exists(identity->identity_dir_ / "drone_id", error)) {
        if (Status status = identity->load(); !status) {
            return status.error();
        }
    }
    return identity;
}

Status DroneIdentity::load() {
    const auto drone_id = read_file(identity_dir_ / "drone_id");
    const auto key_pem = read_file(identity_dir_ / "drone_key.pem");
    if (!drone_id || !key_pem) {
        return make_error(ErrorKind::NotProvisioned, "Identity directory is incomplete: " + identity_dir_.string());
    }

    BioPtr bio{BIO_new_mem_buf(key_pem->data(), static_cast<int>(key_pem->size()))};
    PrivateKeyPtr key{bio ? PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr) : nullptr};
    if (!key || EVP_PKEY_get_id(key.get()) != EVP_PKEY_ED25519) {
        return make_error(ErrorKind::CryptoFailure, "drone_key.pem is not an Ed25519 private key");
    }

    auto public_pem = public_key_to_pem(key.get());
    if (!public_pem) {
        return public_pem.error();
    }

    std::map<std::string, OperatorCredential, std::less<>> operators;
    if (const auto operators_text = read_file(identity_dir_ / "operators.json")) {
        const nlohmann::json document = nlohmann::json::parse(*operators_text, nullptr, false);
        if (document.is_discarded() || !document.is_object()) {
            return make_error(ErrorKind::IoFailure, "operators.json is malformed");
        }
        for (const auto& [operator_id, credential] : document.items()) {
            if (!credential.is_object() || !credential.contains("salt") || !credential.contains("hash")
                || !credential.at("salt").is_string() || !credential.at("hash").is_string()) {
                return make_error(ErrorKind::IoFailure, "operators.json entry is malformed: " + operator_id);
            }
            operators[operator_id] = OperatorCredential{
                credential.at("salt").get<std::string>(),
                credential.at("hash").get<std::string>(),
            };
        }
    }

    str_drone_id_ = trim(*drone_id);
    str_org_id_ = trim(read_file(identity_dir_ / "org_id").value_or(""));
    str_hardware_fingerprint_ = trim(read_file(identity_dir_ / "hardware_fingerprint").value_or(""));
    str_public_key_pem_ = std::move(public_pem).value();
    private_key_ = std::move(key);
    {
        std::scoped_lock lock(operators_mutex_);
        map_operators_ = std::move(operators);
    }

    logger_->info("Loaded drone identity {} (org {})", str_drone_id_, str_org_id_);
    return Status::success();
}

Result<ProvisionResult> DroneIdentity::provision(const std::string& org_id) {
    std::error_code error;
    if (is_provisioned() || std::filesystem::exists(identity_dir_ / "drone_id", error)
        || std::filesystem::exists(identity_dir_ / "drone_key.pem", error)) {
        logger_->warn("Refusing to provision over existing identity in {}", identity_dir_.string());
        return make_error(ErrorKind::AlreadyProvisioned, "Identity already exists in " + identity_dir_.string());
    }

    std::filesystem::create_directories(identity_dir_, error);
    if (error) {
        return make_error(ErrorKind::IoFailure, "Unable to create " + identity_dir_.string() + ": " + error.message());
    }

    auto key = generate_ed25519_key();
    if (!key) {
        return key.error();
    }
    auto private_pem = private_key_to_pem(key.value().get());
    auto public_pem = public_key_to_pem(key.value().get());
    if (!private_pem) {
        return private_pem.error();
    }
    if (!public_pem) {
        return public_pem.error();
    }

    auto secret_bytes = secure_random_bytes(k_operator_secret_bytes);
    if (!secret_bytes) {
        return secret_bytes.error();
    }

    ProvisionResult result{};
    result.drone_id = id_generator_->next();
    result.org_id = org_id;
    result.public_key_pem = public_pem.value();
    result.hardware_fingerprint = compute_hardware_fingerprint(system_root_, *id_generator_);
    result.operator_id = id_generator_->next();
    result.operator_secret = hex_encode(secret_bytes.value());

    auto credential = make_credential(result.operator_secret);
    if (!credential) {
        return credential.error();
    }

    struct IdentityFile final {
        std::string_view name;
        std::string_view content;
        bool owner_only;
    };
    // Key material first so a partial write never leaves a drone_id without its key.
    const std::array<IdentityFile, 5> list_files{{
        {"drone_key.pem", private_pem.value(), true},
        {"drone_key_pub.pem", public_pem.value(), false},
        {"hardware_fingerprint", result.hardware_fingerprint, false},
        {"org_id", result.org_id, false},
        {"drone_id", result.drone_id, false},
    }};
    for (const IdentityFile& file : list_files) {
        if (Status status = write_file(identity_dir_ / file.name, file.content, file.owner_only); !status) {
            return status.error();
        }
    }

    str_drone_id_ = result.drone_id;
    str_org_id_ = result.org_id;
    str_hardware_fingerprint_ = result.hardware_fingerprint;
    str_public_key_pem_ = result.public_key_pem;
    private_key_ = std::move(key).value();
    {
        std::scoped_lock lock(operators_mutex_);
        map_operators_.clear();
        map_operators_[result.operator_id] = std::move(credential).value();
    }
    if (Status status = save_operators(); !status) {
        return status.error();
    }

    logger_->info(
        "Provisioned drone {} for org {} (fingerprint {})",
        result.drone_id,
        result.org_id,
        result.hardware_fingerprint.substr(0, 16)
    );
    return result;
}

Status DroneIdentity::add_operator(const std::string& operator_id, const std::string& secret) {
    if (!is_provisioned()) {
        return make_error(ErrorKind::NotProvisioned, "Drone not provisioned");
    }
    if (operator_id.empty() || secret.empty()) {
        return make_error(ErrorKind::InvalidArgument, "Operator id and secret must be non-empty");
    }
    auto credential = make_credential(secret);
    if (!credential) {
        return credential.error();
    }
    {
        std::scoped_lock lock(operators_mutex_);
        map_operators_[operator_id] = std::move(credential).value();
    }
    logger_->info("Registered operator {}", operator_id);
    return save_operators();
}

Result<DroneIdentity::OperatorCredential> DroneIdentity::make_credential(std::string_view secret) const {
    auto salt = secure_random_bytes(k_operator_salt_bytes);
    if (!salt) {
        return salt.error();
    }
    OperatorCredential credential{};
    credential.salt_hex = hex_encode(salt.value());
    credential.hash_hex = hmac_sha256_hex(credential.salt_hex, secret);
    return credential;
}

Status DroneIdentity::save_operators() const {
    nlohmann::json document = nlohmann::json::object();
    {
        std::scoped_lock lock(operators_mutex_);
        for (const auto& [operator_id, credential] : map_operators_) {
            document[operator_id] = {{"salt", credential.salt_hex}, {"hash", credential.hash_hex}};
        }
    }
    return write_file(identity_dir_ / "operators.json", document.dump(2), true);
}

Result<ByteBuffer> DroneIdentity::sign(std::span<const std::uint8_t> data) const {
    if (!private_key_) {
        return make_error(ErrorKind::NotProvisioned, "Drone not provisioned");
    }
    DigestContextPtr context{EVP_MD_CTX_new()};
    std::size_t signature_length = 0;
    if (!context || EVP_DigestSignInit(context.get(), nullptr, nullptr, nullptr, private_key_.get()) != 1
        || EVP_DigestSign(context.get(), nullptr, &signature_length, data.data(), data.size()) != 1) {
        return make_error(ErrorKind::CryptoFailure, "Ed25519 signing setup failed");
    }
    ByteBuffer signature(signature_length);
    if (EVP_DigestSign(context.get(), signature.data(), &signature_length, data.data(), data.size()) != 1) {
        return make_error(ErrorKind::CryptoFailure, "Ed25519 signing failed");
    }
    signature.resize(signature_length);
    return signature;
}

bool DroneIdentity::verify(std::span<const std::uint8_t> data, std::span<const std::uint8_t> signature) const {
    if (!private_key_) {
        logger_->warn("Signature verification requested without a provisioned identity");
        return false;
    }
    DigestContextPtr context{EVP_MD_CTX_new()};
    if (!context || EVP_DigestVerifyInit(context.get(), nullptr, nullptr, nullptr, private_key_.get()) != 1) {
        return false;
    }
    return EVP_DigestVerify(context.get(), signature.data(), signature.size(), data.data(), data.size()) == 1;
}

bool DroneIdentity::verify_operator(std::string_view operator_id, std::string_view secret) const {
    std::scoped_lock lock(operators_mutex_);
    const auto found = map_operators_.find(operator_id);
    if (found == map_operators_.end()) {
        // Same HMAC work for unknown operators keeps the timing uniform.
        [[maybe_unused]] const std::string decoy = hmac_sha256_hex(k_timing_decoy_salt, secret);
        return false;
    }
    const std::string provided_hash = hmac_sha256_hex(found->second.salt_hex, secret);
    return constant_time_equals(provided_hash, found->second.hash_hex);
}

std::string DroneIdentity::compute_hardware_fingerprint(const std::filesystem::path& system_root, IdGenerator& id_generator) {
    std::string str_serial;
    if (const auto serial = read_file(system_root / "proc/device-tree/serial-number")) {
        str_serial = trim(*serial);
    } else if (const auto machine_id = read_file(system_root / "etc/machine-id")) {
        str_serial = trim(*machine_id);
    } else {
        str_serial = id_generator.next();
    }

    std::string raw = str_serial;
    if (const auto mac = first_hardware_mac(system_root / "sys/class/net")) {
        raw += "|" + *mac;
    }
    return sha256_hex(raw);
}

}  // namespace drone_sentry
