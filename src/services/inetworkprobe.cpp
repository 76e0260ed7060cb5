/**
 * @file inetworkprobe.cpp
 * @brief Implementation file for INetworkProbe interface.
 *
 * Gives MOC a translation unit for the interface's signals.
 */

#include "inetworkprobe.h"
