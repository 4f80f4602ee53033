#ifndef TSQUERY_CONFIG_H_
#define TSQUERY_CONFIG_H_

// Project version
#define TSQUERY_VERSION_MAJOR 1
#define TSQUERY_VERSION_MINOR 0
#define TSQUERY_VERSION_PATCH 0
#define TSQUERY_VERSION "1.0.0"

// Defaults shared by the command layer and the configuration structs
#define TSQUERY_DEFAULT_SLOT_LIMIT 1000

#endif // TSQUERY_CONFIG_H_
