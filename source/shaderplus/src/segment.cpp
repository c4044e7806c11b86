#include "shaderplus/segment.hpp"

#include <algorithm>
#include <cmath>

namespace shaderplus
{
    Segment Segment::makeText(std::string raw)
    {
        Segment s;
        s.kind = SegmentKind::eText;
        s.text = std::move(raw);
        return s;
    }

    Segment Segment::makeInclude(std::string path)
    {
        Segment s;
        s.kind = SegmentKind::eInclude;
        s.text = std::move(path);
        return s;
    }

    Segment Segment::makeConstant(std::string constName)
    {
        Segment s;
        s.kind = SegmentKind::eConstant;
        s.text = std::move(constName);
        return s;
    }

    Segment Segment::makeConditional(Expression cond, Segment whenTrue)
    {
        Segment s;
        s.kind      = SegmentKind::eConditional;
        s.condition = std::make_unique<Expression>(std::move(cond));
        s.ifTrue    = std::make_unique<Segment>(std::move(whenTrue));
        return s;
    }

    Segment Segment::makeConditional(Expression cond, Segment whenTrue, Segment whenFalse)
    {
        Segment s = makeConditional(std::move(cond), std::move(whenTrue));
        s.ifFalse = std::make_unique<Segment>(std::move(whenFalse));
        return s;
    }

    Segment Segment::makeSequence(std::vector<Segment> items)
    {
        Segment s;
        s.kind     = SegmentKind::eSequence;
        s.children = std::move(items);
        return s;
    }

    bool Segment::canConcatFast(const Segment& other) const
    {
        return kind == SegmentKind::eSequence || other.kind == SegmentKind::eSequence ||
               (kind == SegmentKind::eText && other.kind == SegmentKind::eText);
    }

    void Segment::appendToSequence(Segment seg)
    {
        if (!children.empty() && children.back().canConcatFast(seg))
            children.back().concat(std::move(seg));
        else
            children.push_back(std::move(seg));
    }

    void Segment::concat(Segment other)
    {
        const bool selfSeq  = kind == SegmentKind::eSequence;
        const bool otherSeq = other.kind == SegmentKind::eSequence;

        if (selfSeq && otherSeq)
        {
            children.reserve(children.size() + other.children.size());
            for (auto& seg : other.children)
                appendToSequence(std::move(seg));
            return;
        }

        if (kind == SegmentKind::eText && other.kind == SegmentKind::eText)
        {
            text += other.text;
            return;
        }

        if (otherSeq)
        {
            // Prepend ourselves to the incoming sequence and take its place.
            Segment left = std::move(*this);
            *this        = std::move(other);

            if (!children.empty() && left.canConcatFast(children.front()))
            {
                left.concat(std::move(children.front()));
                children.front() = std::move(left);
            }
            else
            {
                children.insert(children.begin(), std::move(left));
            }
            return;
        }

        if (selfSeq)
        {
            appendToSequence(std::move(other));
            return;
        }

        Segment left = std::move(*this);
        *this        = makeSequence({});
        children.reserve(2);
        children.push_back(std::move(left));
        children.push_back(std::move(other));
    }

    Result<void> Segment::write(std::string& out, const Environment& env, const IncludeResolver& includes) const
    {
        switch (kind)
        {
            case SegmentKind::eText:
                out += text;
                return Result<void>::ok();

            case SegmentKind::eInclude:
            {
                auto r = includes.resolve(text);
                if (!r.isOk())
                    return Result<void>::err(r.error());
                out += r.value();
                out.push_back('\n');
                return Result<void>::ok();
            }

            case SegmentKind::eConditional:
            {
                auto c = evaluate(*condition, env);
                if (!c.isOk())
                    return Result<void>::err(c.error());

                if (is_truthy(c.value()))
                    return ifTrue->write(out, env, includes);
                if (ifFalse)
                    return ifFalse->write(out, env, includes);
                return Result<void>::ok();
            }

            case SegmentKind::eSequence:
                for (const auto& child : children)
                {
                    auto r = child.write(out, env, includes);
                    if (!r.isOk())
                        return r;
                }
                return Result<void>::ok();

            case SegmentKind::eConstant:
            {
                auto v = env.get(text);
                if (!v)
                    return Result<void>::err({ErrorCode::eUndefinedVariable, "Undefined constant: " + text});

                // No shader-language spelling for inf / nan.
                if (v->isFloat() && !std::isfinite(v->real))
                    return Result<void>::err({ErrorCode::eInvalidExpression,
                                              "Constant " + text + " is not finite: " + literal_to_string(*v)});

                out += "const ";
                out += text;
                out += " = ";
                out += literal_to_string(*v);
                out += ";\n";
                return Result<void>::ok();
            }
        }

        return Result<void>::err({ErrorCode::eInvalidArgument, "Unknown segment kind."});
    }

    size_t Segment::depth() const
    {
        size_t inner = 0;
        switch (kind)
        {
            case SegmentKind::eConditional:
                inner = ifTrue ? ifTrue->depth() : 0;
                if (ifFalse)
                    inner = std::max(inner, ifFalse->depth());
                break;
            case SegmentKind::eSequence:
                for (const auto& child : children)
                    inner = std::max(inner, child.depth());
                break;
            default:
                break;
        }
        return inner + 1;
    }
} // namespace shaderplus
