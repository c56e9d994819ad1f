#include "wallet/Options.hpp"
#include "config/Config.hpp"

using namespace cw::wallet;

WalletOptions WalletOptions::fromConfig(const config::Config& config) {
    WalletOptions opts;
    opts.audit_credential_reads = config.auditing.audit_credential_reads;
    opts.audit_log_reads = config.auditing.audit_log_reads;
    opts.default_page_size = config.auditing.default_page_size;
    return opts;
}
