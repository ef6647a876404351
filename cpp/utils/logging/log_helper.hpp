#pragma once
#include "logger.hpp"
#include <sstream>

/**
 * Logging helper macros for component-tagged logging
 * Usage: LOG_INFO_COMP("PARTITIONER", "message")
 */
#define LOG_INFO_COMP(component, msg) \
    do { \
        logging::Logger logger(component); \
        logger.info(msg); \
    } while(0)

#define LOG_WARN_COMP(component, msg) \
    do { \
        logging::Logger logger(component); \
        logger.warn(msg); \
    } while(0)

#define LOG_ERROR_COMP(component, msg) \
    do { \
        logging::Logger logger(component); \
        logger.error(msg); \
    } while(0)

// Per-order chatter; the level check runs before the message is built.
#define LOG_DEBUG_COMP(component, msg) \
    do { \
        if (logging::LogManager::get_instance().get_level() <= logging::LogLevel::DEBUG) { \
            logging::Logger logger(component); \
            logger.debug(msg); \
        } \
    } while(0)
