#pragma once

#ifdef SWIPE_ENABLE_TRACY
#  include <tracy/Tracy.hpp>
#  define SWIPE_ZONE ZoneScoped
#else
#  define SWIPE_ZONE
#endif
