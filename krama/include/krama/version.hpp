#pragma once

#define KRAMA_VERSION "1.3.0"
