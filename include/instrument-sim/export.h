#ifndef INSTRUMENT_SIM_EXPORT_H
#define INSTRUMENT_SIM_EXPORT_H

#ifdef _WIN32
#ifdef instrument_sim_core_EXPORTS
#define INSTRUMENT_SIM_API __declspec(dllexport)
#else
#define INSTRUMENT_SIM_API __declspec(dllimport)
#endif
#else
#define INSTRUMENT_SIM_API
#endif

#endif // INSTRUMENT_SIM_EXPORT_H
