#define NONIUS_RUNNER
#include <nonius/nonius.h++>
