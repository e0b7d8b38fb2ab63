#pragma once
///@file

#include "baseimg/libutil/json-fwd.hh"
#include "baseimg/libutil/types.hh"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace baseimg {

/**
 * The Config class provides base-img's runtime configuration.
 *
 * A configuration is a collection of uniquely named settings. Each
 * setting records its value, a default and a description:
 *
 *   Config config;
 *   Setting<std::string> output{&config, "base.tar.xz", "output", "where to write the image"};
 *
 * Settings are changed by configuration files (`name = value` lines)
 * and by `--option name value` on the command line.
 */

/**
 * Where a configuration comes from, for resolving relative paths and
 * reporting errors.
 */
struct ApplyConfigOptions
{
    /**
     * The configuration file being loaded. If set, relative paths are
     * interpreted as relative to its directory.
     */
    std::optional<Path> path = std::nullopt;

    /**
     * If set, `~/` paths are allowed and the tilde is replaced by this
     * directory.
     */
    std::optional<Path> home = std::nullopt;

    std::string relativeDisplay() const
    {
        return path ? *path : "<unknown>";
    }
};

class AbstractSetting;

class AbstractConfig
{
public:
    struct SettingInfo
    {
        std::string value;
        std::string description;
    };

protected:
    StringMap unknownSettings;

    AbstractConfig(StringMap initials = {});

public:
    virtual ~AbstractConfig() = default;

    /**
     * Sets the value referenced by `name` to `value`. Returns true if the
     * setting is known, false otherwise.
     */
    virtual bool set(
        const std::string & name,
        const std::string & value,
        const ApplyConfigOptions & options = {}
    ) = 0;

    /**
     * Adds the currently known settings to the given result map `res`.
     * - res: map to store settings in
     * - overriddenOnly: when set to true only overridden settings will be added to `res`
     */
    virtual void getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly = false) = 0;

    /**
     * Resets the `overridden` flag of all Settings
     */
    virtual void resetOverridden() = 0;

    virtual JSON toJSON() = 0;

    /**
     * Outputs all settings as `name = value` lines.
     */
    std::string toKeyValue(bool overriddenOnly = false);

    /**
     * Parses the configuration in `contents` and applies it.
     */
    void applyConfig(const std::string & contents, const ApplyConfigOptions & options = {});

    /**
     * Applies the configuration file at `path`. A file that does not
     * exist is not an error.
     */
    void applyConfigFile(const Path & path, const std::optional<Path> & home = std::nullopt);

    /**
     * Logs a warning for each unregistered setting
     */
    void warnUnknownSettings();

    /**
     * Re-applies all previously attempted changes to unknown settings
     */
    void reapplyUnknownSettings();
};

/* A class to simplify providing configuration settings. The typical
   use is to inherit Config and add Setting<T> members:

   class MyClass : private Config
   {
     Setting<int> foo{this, 123, "foo", "the number of foos to use"};
     Setting<std::string> bar{this, "blabla", "bar", "the name of the bar"};
   };
*/
class Config : public AbstractConfig
{
    friend class AbstractSetting;

public:
    struct SettingData
    {
        bool isAlias;
        AbstractSetting * setting;
    };

    typedef std::map<std::string, SettingData> Settings;

private:
    Settings _settings;

public:
    Config(StringMap initials = {});

    bool set(const std::string & name, const std::string & value, const ApplyConfigOptions & options = {}) override;

    void addSetting(AbstractSetting * setting);

    void getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly = false) override;

    void resetOverridden() override;

    JSON toJSON() override;
};

class AbstractSetting
{
    friend class Config;

public:
    const std::string name;
    const std::string description;
    const std::set<std::string> aliases;

    bool overridden = false;

protected:
    AbstractSetting(
        const std::string & name,
        const std::string & description,
        const std::set<std::string> & aliases);

    virtual ~AbstractSetting() = default;

    virtual void set(const std::string & value, bool append = false, const ApplyConfigOptions & options = {}) = 0;

    virtual bool isAppendable()
    {
        return false;
    }

    virtual std::string to_string() const = 0;

    JSON toJSON();

    virtual std::map<std::string, JSON> toJSONObject() const;

public:
    bool isOverridden() const;
};

/**
 * A setting of type T.
 */
template<typename T>
class BaseSetting : public AbstractSetting
{
protected:
    T value;
    const T defaultValue;

    /**
     * Parse a string into a `T` value.
     */
    virtual T parse(const std::string & str, const ApplyConfigOptions & options) const;

    /**
     * Either replace the current value, or, for appendable types
     * (lists and sets of strings), append to it.
     */
    virtual void appendOrSet(T newValue, bool append, const ApplyConfigOptions & options);

public:
    BaseSetting(
        const T & def,
        const std::string & name,
        const std::string & description,
        const std::set<std::string> & aliases = {})
        : AbstractSetting(name, description, aliases)
        , value(def)
        , defaultValue(def)
    { }

    operator const T &() const { return value; }
    operator T &() { return value; }
    const T & get() const { return value; }
    bool operator ==(const T & v2) const { return value == v2; }
    bool operator !=(const T & v2) const { return value != v2; }
    void operator =(const T & v) { assign(v); }
    virtual void assign(const T & v) { value = v; }
    void setDefault(const T & v) { if (!overridden) value = v; }

    void set(const std::string & str, bool append = false, const ApplyConfigOptions & options = {}) override final;

    bool isAppendable() override final;

    virtual void override(const T & v)
    {
        overridden = true;
        value = v;
    }

    std::string to_string() const override;

    std::map<std::string, JSON> toJSONObject() const override;
};

template<> std::string BaseSetting<std::string>::parse(const std::string & str, const ApplyConfigOptions & options) const;
template<> std::string BaseSetting<std::string>::to_string() const;
template<> bool BaseSetting<bool>::parse(const std::string & str, const ApplyConfigOptions & options) const;
template<> std::string BaseSetting<bool>::to_string() const;
template<> Strings BaseSetting<Strings>::parse(const std::string & str, const ApplyConfigOptions & options) const;
template<> std::string BaseSetting<Strings>::to_string() const;
template<> StringSet BaseSetting<StringSet>::parse(const std::string & str, const ApplyConfigOptions & options) const;
template<> void BaseSetting<StringSet>::appendOrSet(StringSet newValue, bool append, const ApplyConfigOptions & options);
template<> std::string BaseSetting<StringSet>::to_string() const;

extern template class BaseSetting<int>;
extern template class BaseSetting<unsigned int>;
extern template class BaseSetting<bool>;
extern template class BaseSetting<std::string>;
extern template class BaseSetting<Strings>;
extern template class BaseSetting<StringSet>;

template<typename T>
std::ostream & operator <<(std::ostream & str, const BaseSetting<T> & opt)
{
    return str << static_cast<const T &>(opt);
}

template<typename T>
class Setting : public BaseSetting<T>
{
public:
    Setting(Config * options,
        const T & def,
        const std::string & name,
        const std::string & description,
        const std::set<std::string> & aliases = {})
        : BaseSetting<T>(def, name, description, aliases)
    {
        options->addSetting(this);
    }

    void operator =(const T & v) { this->assign(v); }
};

/**
 * A setting holding a path. Values are canonicalised, and relative
 * values from a configuration file are resolved against the file's
 * directory. With `allowEmpty`, the empty string is kept as is.
 */
class PathSetting : public BaseSetting<Path>
{
    bool allowEmpty;

protected:
    Path parse(const std::string & str, const ApplyConfigOptions & options) const override;

public:
    PathSetting(Config * options,
        bool allowEmpty,
        const Path & def,
        const std::string & name,
        const std::string & description,
        const std::set<std::string> & aliases = {})
        : BaseSetting<Path>(def, name, description, aliases)
        , allowEmpty(allowEmpty)
    {
        options->addSetting(this);
    }

    Path operator +(const char * p) const { return value + p; }

    void operator =(const Path & v) { this->assign(v); }
};

struct GlobalConfig : public AbstractConfig
{
    typedef std::vector<Config*> ConfigRegistrations;
    static ConfigRegistrations * configRegistrations;

    bool set(const std::string & name, const std::string & value, const ApplyConfigOptions & options = {}) override;

    void getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly = false) override;

    void resetOverridden() override;

    JSON toJSON() override;

    struct Register
    {
        Register(Config * config);
    };
};

extern GlobalConfig globalConfig;

}
