/**
 * @file itransferclient.cpp
 * @brief Implementation file for ITransferClient interface.
 *
 * Gives MOC a translation unit for the interface's signals.
 */

#include "itransferclient.h"
