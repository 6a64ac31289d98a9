#pragma once

#include <cfgonce/config_file.hpp>
#include <memory>

namespace cfgonce {

// A config file declared once at startup and shared read-only afterwards.
//
//     auto app_config = ConfigItem<Settings>::declare(policy);
//     auto settings = app_config.value().read_or_default();
//
// T takes part in (de)serialization through nlohmann's to_json/from_json.
// Nothing here locks the file; concurrent read-modify-write cycles need
// external synchronisation.
template<typename T>
class ConfigItem {
public:
    static Result<ConfigItem> declare(ConfigPathMetadata meta) {
        CFGONCE_TRY(meta.validate());
        return Result<ConfigItem>::ok(ConfigItem(
            std::make_shared<const ConfigPathMetadata>(std::move(meta))));
    }

    const ConfigPathMetadata& metadata() const { return *meta_; }
    const std::shared_ptr<const ConfigPathMetadata>& shared_metadata() const { return meta_; }

    Result<RawConfigFile> search() const {
        return search_config_file(meta_);
    }

    // search() followed by fallback_default() and check()
    Result<ConfigFile> resolve() const {
        CFGONCE_TRY_ASSIGN(RawConfigFile raw, search());
        CFGONCE_TRY_ASSIGN(RawConfigFile located, raw.fallback_default());
        return located.check();
    }

    Result<T> read() const {
        return resolve().and_then([](const ConfigFile& file) { return file.template read<T>(); });
    }

    Status write(const T& value) const {
        return resolve().and_then([&value](const ConfigFile& file) { return file.write(value); });
    }

    Result<T> read_or_default() const {
        return resolve().and_then([](const ConfigFile& file) {
            return file.template read_or_default<T>();
        });
    }

    Result<T> read_or_new(T default_value) const {
        return resolve().and_then([&default_value](const ConfigFile& file) {
            return file.read_or_new(std::move(default_value));
        });
    }

private:
    explicit ConfigItem(std::shared_ptr<const ConfigPathMetadata> meta)
        : meta_(std::move(meta)) {}

    std::shared_ptr<const ConfigPathMetadata> meta_;
};

} // namespace cfgonce
