#include "baseimg/libimage/globals.hh"
#include "baseimg/libutil/environment-variables.hh"
#include "baseimg/libutil/logging.hh"
#include "baseimg/libutil/users.hh"

namespace baseimg {

ImageSettings settings;

static GlobalConfig::Register rSettings(&settings);

ImageSettings::ImageSettings()
    : systemConfFile(getEnvNonEmpty("BASEIMG_CONF_FILE").value_or(BASEIMG_CONF_DIR "/base-img.conf"))
{
}

Path ImageSettings::storeDir() const
{
    return "/" + storeMountPoint.get() + "/store";
}

Path ImageSettings::confDir() const
{
    return "/" + storeMountPoint.get() + "/etc";
}

void loadConfFile()
{
    globalConfig.applyConfigFile(settings.systemConfFile);

    auto home = tryGetHome();
    if (home || getEnvNonEmpty("XDG_CONFIG_HOME"))
        globalConfig.applyConfigFile(getConfigDir() + "/base-img/base-img.conf", home);
    else
        debug("no home directory, not reading a user configuration file");
}

}
