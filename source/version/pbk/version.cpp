#include <pbk/version.hpp>

#define STRINGIFY(x) #x
#define TOSTRING(x) STRINGIFY(x)

std::string_view PictureBookVersion()
{
#ifdef PBK_VERSION
    return TOSTRING(PBK_VERSION);
#else
    return "<unknown version>";
#endif
}

std::string_view PictureBookBuildTime()
{
#ifdef PBK_NOW
    return TOSTRING(PBK_NOW);
#else
    return "<unknown build time>";
#endif
}
