#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

struct SessionConfig {
    std::string host;
    int port = 22;
    std::string username = "root";
    std::string password;
    std::chrono::seconds keepaliveInterval{10};
    std::chrono::seconds connectTimeout{15};
};

struct ExecutorConfig {
    std::string pathExport = "export PATH=/opt/bin:/opt/sbin:/usr/local/bin:/usr/bin:/bin:/usr/sbin:/sbin;";
    std::chrono::milliseconds pollInterval{200};
    std::size_t readChunkSize = 4096;
    std::size_t inputChunkSize = 512 * 1024;
};

struct ResetConfig {
    std::string resetCommand = "echo \"all\" | /usr/bin/nc -U /var/run/wipe.sock";
    std::vector<std::string> acknowledgementTokens = {
        "ok", "logging you out now", "please reconnect", "you need to log back in"};
    std::chrono::seconds resetTimeout{120};
    std::chrono::milliseconds gracePeriod{30000};
    std::chrono::milliseconds pollInterval{5000};
    std::chrono::milliseconds probeTimeout{2000};
    std::chrono::seconds echoTimeout{5};
    std::string echoCommand = "echo online";
    std::string onlineMarker = "online";
    // Unset: wait for the device indefinitely.
    std::optional<std::chrono::milliseconds> deadline;
};

struct TransferPolicy {
    int maxAttempts = 3;
    std::chrono::milliseconds initialBackoff{500};
    double backoffMultiplier = 2.0;
    double spaceFactor = 1.5;
    std::size_t chunkSize = 32 * 1024;
    std::chrono::milliseconds progressInterval{10000};
};

struct InstallerConfig {
    std::string remoteArchiveDir = "/mnt/UDISK/printer_data/config/bootstrap";
    std::string remoteArchiveName = "bootstrap.tar.gz";
    std::string bootstrapScript = "bootstrap.sh";
    std::vector<std::string> bootstrapTokens = {
        "ok", "logging you out now", "please reconnect", "you need to log back in"};
    std::string featureScriptPath = "/mnt/UDISK/root/k2-improvements/gimme-the-jamin.sh";
    std::chrono::seconds featureScriptTimeout{1800};
    std::string remoteCloneDir = "~/Printer";
    std::string repositoryUrl = "https://github.com/Jacob10383/Printer.git";
    std::chrono::seconds cloneTimeout{300};
    std::chrono::seconds checkoutTimeout{120};
    std::string auxiliaryHost = "github.com";
    int auxiliaryPort = 443;
    std::chrono::milliseconds auxiliaryProbeTimeout{3000};
};
