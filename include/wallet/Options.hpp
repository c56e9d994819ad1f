#pragma once

namespace cw::config { struct Config; }

namespace cw::wallet {

struct WalletOptions {
    bool audit_credential_reads = false;
    bool audit_log_reads = false;
    unsigned int default_page_size = 100;

    static WalletOptions fromConfig(const config::Config& config);
};

}
