#include "LabCatalog.h"

using json = nlohmann::json;

namespace {

LabTypeDefinition make_lab(const std::string& id, const std::string& name, const std::string& image,
                           const std::string& category, const std::string& difficulty, int port,
                           const std::string& description,
                           std::vector<Security::TmpfsMount> mounts) {
    LabTypeDefinition lab;
    lab.id = id;
    lab.name = name;
    lab.image = image;
    lab.category = category;
    lab.difficulty = difficulty;
    lab.port = port;
    lab.description = description;
    lab.security.tmpfs_mounts = std::move(mounts);
    return lab;
}

} // namespace

LabCatalog::LabCatalog(std::vector<LabTypeDefinition> labs)
    : labs_(std::move(labs)) {}

std::optional<LabTypeDefinition> LabCatalog::find(const std::string& id) const {
    for (const auto& lab : labs_) {
        if (lab.id == id) return lab;
    }
    return std::nullopt;
}

bool LabCatalog::contains(const std::string& id) const {
    return find(id).has_value();
}

std::string LabCatalog::ids() const {
    std::string out;
    for (const auto& lab : labs_) {
        if (!out.empty()) out += ", ";
        out += lab.id;
    }
    return out;
}

json LabCatalog::to_json() const {
    json list = json::array();
    for (const auto& lab : labs_) {
        list.push_back({
            {"id", lab.id},
            {"name", lab.name},
            {"category", lab.category},
            {"difficulty", lab.difficulty},
            {"port", lab.port},
            {"description", lab.description},
        });
    }
    return list;
}

std::vector<LabTypeDefinition> LabCatalog::builtin() {
    using Security::TmpfsMount;
    return {
        make_lab("dvwa", "Damn Vulnerable Web Application", "vulnerables/web-dvwa",
                 "web", "beginner", 80, "Practice SQL injection, XSS, command injection",
                 {TmpfsMount("/var/lib/mysql", 100), TmpfsMount("/var/run/mysqld", 10),
                  TmpfsMount("/var/log", 50), TmpfsMount("/tmp", 50)}),
        make_lab("webgoat", "OWASP WebGoat", "webgoat/webgoat:latest",
                 "web", "beginner", 8080, "OWASP Top 10 practice environment",
                 {TmpfsMount("/home/webgoat/.webgoat", 100), TmpfsMount("/tmp", 50)}),
        make_lab("juice-shop", "OWASP Juice Shop", "bkimminich/juice-shop",
                 "web", "beginner", 3000, "Modern web application vulnerabilities",
                 {TmpfsMount("/juice-shop/data", 100), TmpfsMount("/tmp", 50)}),
        make_lab("metasploitable", "Metasploitable 2", "tleemcjr/metasploitable2",
                 "system", "intermediate", 22, "Full penetration testing environment",
                 {TmpfsMount("/var/log", 50), TmpfsMount("/tmp", 50)}),
        make_lab("crypto-lab", "Cryptography Lab", "custom/crypto-tools",
                 "challenge", "beginner", 7681, "Pre-installed crypto tools (hashcat, john, rockyou.txt)",
                 {TmpfsMount("/tmp", 100), TmpfsMount("/home/challenge", 50)}),
        make_lab("forensics-lab", "Digital Forensics Lab", "custom/forensics-tools",
                 "challenge", "intermediate", 7681, "Forensics tools (volatility, binwalk, foremost)",
                 {TmpfsMount("/tmp", 100), TmpfsMount("/home/challenge", 50)}),
    };
}
