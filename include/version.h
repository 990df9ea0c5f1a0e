#pragma once

#define VERDANT_VERSION "1.0.0"
