
#include <primer_common/primer_result.h>

primer_common::PrimerStatus::PrimerStatus(
    tempo_utils::StatusCode statusCode,
    std::shared_ptr<const tempo_utils::Detail> detail)
    : tempo_utils::TypedStatus<PrimerCondition>(statusCode, detail)
{
}

bool
primer_common::PrimerStatus::convert(PrimerStatus &dstStatus, const tempo_utils::Status &srcStatus)
{
    std::string_view srcNs = srcStatus.getErrorCategory();
    std::string_view dstNs = kPrimerStatusNs;
    if (srcNs != dstNs)
        return false;
    dstStatus = PrimerStatus(srcStatus.getStatusCode(), srcStatus.getDetail());
    return true;
}
