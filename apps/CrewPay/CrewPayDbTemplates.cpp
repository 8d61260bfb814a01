#include "dbservice/dbservice.hpp"
#include "Repositories/BaseRepository.h"

#include "Models/FlightDutyModel.h"
#include "Models/LayoverRestPeriodModel.h"
#include "Models/MonthlyCalculationModel.h"
#include "Models/AuditTrailEntryModel.h"

// Explicit template instantiations for each stored model type
template class DbService<FlightDutyModel>;
template class DbService<LayoverRestPeriodModel>;
template class DbService<MonthlyCalculationModel>;
template class DbService<AuditTrailEntryModel>;

template class BaseRepository<FlightDutyModel>;
template class BaseRepository<LayoverRestPeriodModel>;
template class BaseRepository<MonthlyCalculationModel>;
template class BaseRepository<AuditTrailEntryModel>;
