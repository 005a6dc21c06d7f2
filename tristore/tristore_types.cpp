#include "tristore_types.h"
#include "tristore_assert.h"


namespace tristore
{


TriplePatternType pattern_type(const TriplePattern& pattern)
{
	if (!pattern.sub)  // if subject variable
	{
		if (!pattern.pred)  // if predicate variable
		{
			if (!pattern.obj)
				return TriplePatternType::VVV;
			else
				return TriplePatternType::VVO;
		}
		else  // if predicate known
		{
			if (!pattern.obj)
				return TriplePatternType::VPV;
			else
				return TriplePatternType::VPO;
		}
	}
	else  // if subject known
	{
		if (!pattern.pred)  // if predicate variable
		{
			if (!pattern.obj)
				return TriplePatternType::SVV;
			else
				return TriplePatternType::SVO;
		}
		else  // if predicate known
		{
			if (!pattern.obj)
				return TriplePatternType::SPV;
			else
				return TriplePatternType::SPO;
		}
	}
}


std::string trip_pat_type_str(TriplePatternType type)
{
	switch (type)
	{
	case TriplePatternType::VVV:
		return "VVV";
	case TriplePatternType::VVO:
		return "VVO";
	case TriplePatternType::VPV:
		return "VPV";
	case TriplePatternType::SVV:
		return "SVV";
	case TriplePatternType::VPO:
		return "VPO";
	case TriplePatternType::SVO:
		return "SVO";
	case TriplePatternType::SPV:
		return "SPV";
	case TriplePatternType::SPO:
		return "SPO";
	default:
		TRISTORE_CHECK_PRECOND(false);
		return "???";
	}
}


std::string rotation_str(Rotation rot)
{
	switch (rot)
	{
	case Rotation::SPO:
		return "SPO";
	case Rotation::POS:
		return "POS";
	case Rotation::OSP:
		return "OSP";
	default:
		TRISTORE_CHECK_PRECOND(false);
		return "???";
	}
}


}  // namespace tristore
