#ifndef SYNAPSE_API_SYNAPSEAPIDEFS_H_
#define SYNAPSE_API_SYNAPSEAPIDEFS_H_

#if defined(__GNUC__)
#define SYNAPSE_API_EXPORT __attribute__((visibility("default")))
#define SYNAPSE_API_IMPORT
#else  // Unsupported compiler
#define SYNAPSE_API_EXPORT
#define SYNAPSE_API_IMPORT
#endif  // defined(__GNUC__)

#ifdef SYNAPSE_BUILD_SHARED_LIB
#define SYNAPSE_API SYNAPSE_API_EXPORT
#else
#define SYNAPSE_API SYNAPSE_API_IMPORT
#endif  // SYNAPSE_BUILD_SHARED_LIB

#endif  // SYNAPSE_API_SYNAPSEAPIDEFS_H_
