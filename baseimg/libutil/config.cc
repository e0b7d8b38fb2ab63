#include "baseimg/libutil/config.hh"
#include "baseimg/libutil/file-system.hh"
#include "baseimg/libutil/json.hh"
#include "baseimg/libutil/logging.hh"
#include "baseimg/libutil/strings.hh"

#include <type_traits>

namespace baseimg {

AbstractConfig::AbstractConfig(StringMap initials)
    : unknownSettings(std::move(initials))
{ }

Config::Config(StringMap initials)
    : AbstractConfig(std::move(initials))
{ }

bool Config::set(const std::string & name, const std::string & value, const ApplyConfigOptions & options)
{
    bool append = false;
    auto i = _settings.find(name);
    if (i == _settings.end()) {
        if (name.starts_with("extra-")) {
            i = _settings.find(std::string(name, 6));
            if (i == _settings.end() || !i->second.setting->isAppendable())
                return false;
            append = true;
        } else
            return false;
    }
    i->second.setting->set(value, append, options);
    i->second.setting->overridden = true;
    return true;
}

void Config::addSetting(AbstractSetting * setting)
{
    _settings.emplace(setting->name, Config::SettingData{false, setting});
    for (const auto & alias : setting->aliases)
        _settings.emplace(alias, Config::SettingData{true, setting});

    bool set = false;

    if (auto i = unknownSettings.find(setting->name); i != unknownSettings.end()) {
        setting->set(std::move(i->second));
        unknownSettings.erase(i);
        set = true;
    }

    for (auto & alias : setting->aliases) {
        if (auto i = unknownSettings.find(alias); i != unknownSettings.end()) {
            if (set)
                printTaggedWarning(
                    "setting '%s' is set, but it's an alias of '%s' which is also set",
                    alias,
                    setting->name
                );
            else {
                setting->set(std::move(i->second));
                unknownSettings.erase(i);
                set = true;
            }
        }
    }
}

void AbstractConfig::warnUnknownSettings()
{
    for (const auto & s : unknownSettings)
        printTaggedWarning("unknown setting '%s'", s.first);
}

void AbstractConfig::reapplyUnknownSettings()
{
    auto unknownSettings2 = std::move(unknownSettings);
    unknownSettings = {};
    for (auto & s : unknownSettings2)
        set(s.first, s.second);
}

void Config::getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly)
{
    for (const auto & opt : _settings)
        if (!opt.second.isAlias && (!overriddenOnly || opt.second.setting->overridden))
            res.emplace(opt.first, SettingInfo{opt.second.setting->to_string(), opt.second.setting->description});
}

static void applyConfigInner(const std::string & contents, const ApplyConfigOptions & options, std::vector<std::pair<std::string, std::string>> & parsedContents)
{
    std::string_view rest = contents;

    while (!rest.empty()) {
        auto [line_, next] = getLine(rest);
        rest = next;
        std::string line(line_);

        if (auto hash = line.find('#'); hash != line.npos)
            line = std::string(line, 0, hash);

        auto tokens = tokenizeString<std::vector<std::string>>(line);
        if (tokens.empty()) continue;

        if (tokens.size() < 2)
            throw UsageError("illegal configuration line '%1%' in '%2%'", line, options.relativeDisplay());

        auto include = false;
        auto ignoreMissing = false;
        if (tokens[0] == "include")
            include = true;
        else if (tokens[0] == "!include") {
            include = true;
            ignoreMissing = true;
        }

        if (include) {
            if (tokens.size() != 2)
                throw UsageError("illegal configuration line '%1%' in '%2%'", line, options.relativeDisplay());
            if (!options.path)
                throw UsageError("can only include configuration '%1%' from files", tokens[1]);
            auto pathToInclude = absPath(tildePath(tokens[1], options.home), dirOf(*options.path));
            if (pathExists(pathToInclude)) {
                auto includeOptions = ApplyConfigOptions {
                    .path = pathToInclude,
                    .home = options.home,
                };
                try {
                    applyConfigInner(readFile(pathToInclude), includeOptions, parsedContents);
                } catch (Error & e) {
                    e.addTrace("in configuration file '%1%' included from '%2%'", pathToInclude, *options.path);
                    throw;
                }
            } else if (!ignoreMissing) {
                throw Error("file '%1%' included from '%2%' not found", pathToInclude, *options.path);
            }
            continue;
        }

        if (tokens[1] != "=")
            throw UsageError("illegal configuration line '%1%' in '%2%'", line, options.relativeDisplay());

        std::string name = std::move(tokens[0]);

        auto i = tokens.begin();
        advance(i, 2);

        parsedContents.push_back({
            std::move(name),
            concatStringsSep(" ", Strings(i, tokens.end())),
        });
    }
}

void AbstractConfig::applyConfig(const std::string & contents, const ApplyConfigOptions & options)
{
    std::vector<std::pair<std::string, std::string>> parsedContents;

    applyConfigInner(contents, options, parsedContents);

    for (const auto & [name, value] : parsedContents)
        set(name, value, options);
}

void AbstractConfig::applyConfigFile(const Path & path, const std::optional<Path> & home)
{
    if (!pathExists(path)) {
        debug("configuration file '%s' does not exist", path);
        return;
    }
    debug("reading configuration file '%s'", path);
    applyConfig(readFile(path), ApplyConfigOptions{.path = path, .home = home});
}

std::string AbstractConfig::toKeyValue(bool overriddenOnly)
{
    std::string res;
    std::map<std::string, SettingInfo> settings;
    getSettings(settings, overriddenOnly);
    for (const auto & s : settings)
        res += fmt("%s = %s\n", s.first, s.second.value);
    return res;
}

void Config::resetOverridden()
{
    for (auto & s : _settings)
        s.second.setting->overridden = false;
}

JSON Config::toJSON()
{
    auto res = JSON::object();
    for (const auto & s : _settings)
        if (!s.second.isAlias)
            res.emplace(s.first, s.second.setting->toJSON());
    return res;
}

AbstractSetting::AbstractSetting(
    const std::string & name,
    const std::string & description,
    const std::set<std::string> & aliases)
    : name(name)
    , description(description)
    , aliases(aliases)
{
}

JSON AbstractSetting::toJSON()
{
    return JSON(toJSONObject());
}

std::map<std::string, JSON> AbstractSetting::toJSONObject() const
{
    std::map<std::string, JSON> obj;
    obj.emplace("description", description);
    obj.emplace("aliases", aliases);
    return obj;
}

bool AbstractSetting::isOverridden() const { return overridden; }

template<typename T>
std::map<std::string, JSON> BaseSetting<T>::toJSONObject() const
{
    auto obj = AbstractSetting::toJSONObject();
    obj.emplace("value", value);
    obj.emplace("defaultValue", defaultValue);
    return obj;
}

template<typename T>
struct SettingTrait
{
    static constexpr bool appendable = false;
};

template<> struct SettingTrait<Strings>
{
    static constexpr bool appendable = true;
};

template<> struct SettingTrait<StringSet>
{
    static constexpr bool appendable = true;
};

template<typename T>
bool BaseSetting<T>::isAppendable()
{
    return SettingTrait<T>::appendable;
}

template<typename T>
void BaseSetting<T>::set(const std::string & str, bool append, const ApplyConfigOptions & options)
{
    appendOrSet(parse(str, options), append, options);
}

template<typename T>
void BaseSetting<T>::appendOrSet(T newValue, bool append, const ApplyConfigOptions & options)
{
    if constexpr (SettingTrait<T>::appendable) {
        if (!append) value.clear();
        value.insert(value.end(), std::make_move_iterator(newValue.begin()),
                                  std::make_move_iterator(newValue.end()));
    } else {
        if (append)
            throw UsageError("setting '%s' cannot be appended to", name);
        assign(std::move(newValue));
    }
}

template<typename T>
T BaseSetting<T>::parse(const std::string & str, const ApplyConfigOptions & options) const
{
    static_assert(std::is_integral<T>::value, "Integer required.");

    if (auto n = string2Int<T>(str))
        return *n;
    else
        throw UsageError("setting '%s' has invalid value '%s'", name, str);
}

template<typename T>
std::string BaseSetting<T>::to_string() const
{
    static_assert(std::is_integral<T>::value, "Integer required.");

    return std::to_string(value);
}

template<> std::string BaseSetting<std::string>::parse(const std::string & str, const ApplyConfigOptions & options) const
{
    return str;
}

template<> std::string BaseSetting<std::string>::to_string() const
{
    return value;
}

template<> bool BaseSetting<bool>::parse(const std::string & str, const ApplyConfigOptions & options) const
{
    if (str == "true" || str == "yes" || str == "1")
        return true;
    else if (str == "false" || str == "no" || str == "0")
        return false;
    else
        throw UsageError("Boolean setting '%s' has invalid value '%s'", name, str);
}

template<> std::string BaseSetting<bool>::to_string() const
{
    return value ? "true" : "false";
}

template<> Strings BaseSetting<Strings>::parse(const std::string & str, const ApplyConfigOptions & options) const
{
    return tokenizeString<Strings>(str);
}

template<> std::string BaseSetting<Strings>::to_string() const
{
    return concatStringsSep(" ", value);
}

template<> StringSet BaseSetting<StringSet>::parse(const std::string & str, const ApplyConfigOptions & options) const
{
    return tokenizeString<StringSet>(str);
}

template<> void BaseSetting<StringSet>::appendOrSet(StringSet newValue, bool append, const ApplyConfigOptions & options)
{
    if (!append) value.clear();
    value.insert(std::make_move_iterator(newValue.begin()), std::make_move_iterator(newValue.end()));
}

template<> std::string BaseSetting<StringSet>::to_string() const
{
    return concatStringsSep(" ", value);
}

template class BaseSetting<int>;
template class BaseSetting<unsigned int>;
template class BaseSetting<bool>;
template class BaseSetting<std::string>;
template class BaseSetting<Strings>;
template class BaseSetting<StringSet>;

Path PathSetting::parse(const std::string & str, const ApplyConfigOptions & options) const
{
    if (str == "") {
        if (allowEmpty)
            return "";
        throw UsageError("setting '%s' is a path and paths cannot be empty", name);
    }
    auto tildeResolvedPath = tildePath(str, options.home);
    if (options.path)
        return absPath(tildeResolvedPath, dirOf(*options.path));
    else
        return canonPath(tildeResolvedPath);
}

bool GlobalConfig::set(const std::string & name, const std::string & value, const ApplyConfigOptions & options)
{
    for (auto & config : *configRegistrations)
        if (config->set(name, value, options)) return true;

    unknownSettings.emplace(name, value);

    return false;
}

void GlobalConfig::getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly)
{
    for (auto & config : *configRegistrations)
        config->getSettings(res, overriddenOnly);
}

void GlobalConfig::resetOverridden()
{
    for (auto & config : *configRegistrations)
        config->resetOverridden();
}

JSON GlobalConfig::toJSON()
{
    auto res = JSON::object();
    for (const auto & config : *configRegistrations)
        res.update(config->toJSON());
    return res;
}

GlobalConfig globalConfig;

GlobalConfig::ConfigRegistrations * GlobalConfig::configRegistrations;

GlobalConfig::Register::Register(Config * config)
{
    if (!configRegistrations)
        configRegistrations = new ConfigRegistrations;
    configRegistrations->emplace_back(config);
}

}
